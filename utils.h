#pragma once

#include <string>
#include <cstdio>

// File I/O utilities
bool fileExists(const std::string& path);
std::string siblingPath(const std::string& path, const std::string& fileName);
std::string modifiedPathFor(const std::string& path);
bool readFile(const std::string& path, std::string& out);
bool writeFileAtomic(const std::string& path, const std::string& data);

// String utilities
std::string redactPath(const std::string& path);

// Output utilities (summary goes to stdout, diagnostics to stderr)
void outPrintf(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
