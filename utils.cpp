#include "utils.h"
#include "logging.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>
#include <cstdio>
#include <cstdarg>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

bool fileExists(const std::string& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

// <dir of path>/<fileName>
std::string siblingPath(const std::string& p, const std::string& fileName) {
  std::filesystem::path path(p);
  return (path.parent_path() / fileName).string();
}

// game.js -> game_modified.js, kept beside the input
std::string modifiedPathFor(const std::string& p) {
  std::filesystem::path path(p);
  std::filesystem::path newPath = path.parent_path() / path.stem();
  newPath += "_modified";
  newPath += path.extension();
  return newPath.string();
}

bool readFile(const std::string& path, std::string& out) {
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;
  std::fseek(f, 0, SEEK_END);
  long n = std::ftell(f);
  std::fseek(f, 0, SEEK_SET);
  if (n < 0) { std::fclose(f); return false; }
  out.resize((size_t)n);
  if (n && std::fread(&out[0], 1, (size_t)n, f) != (size_t)n) { std::fclose(f); return false; }
  std::fclose(f);
  return true;
}

// Removes the temp file unless the rename went through
struct TempFileGuard {
  std::string path;
  bool keep = false;
  ~TempFileGuard() {
    if (!keep) std::remove(path.c_str());
  }
};

// Atomic file write: temp -> flush -> sync -> rename
bool writeFileAtomic(const std::string& path, const std::string& data) {
  std::filesystem::path fsPath(path);
  std::filesystem::path dir = fsPath.parent_path();
  if (dir.empty()) dir = ".";

  // Same directory as the target: rename() must not cross filesystems
  std::string pattern = (dir / ("." + fsPath.filename().string() + ".XXXXXX")).string();
  std::vector<char> name(pattern.begin(), pattern.end());
  name.push_back('\0');

  int fd = mkstemp(name.data());
  if (fd == -1) {
    logDebugf("mkstemp(%s): %s", pattern.c_str(), std::strerror(errno));
    return false;
  }
  TempFileGuard guard{name.data()};

  FILE* f = fdopen(fd, "wb");
  if (!f) {
    close(fd);
    return false;
  }

  // Generated sources are meant to be read and edited, unlike the temp default
  bool ok = fchmod(fd, 0644) == 0 &&
            std::fwrite(data.data(), 1, data.size(), f) == data.size() &&
            std::fflush(f) == 0 && fsync(fd) == 0;
  if (std::fclose(f) != 0) ok = false;
  if (!ok) {
    logDebugf("write to %s failed: %s", guard.path.c_str(), std::strerror(errno));
    return false;
  }

  if (std::rename(guard.path.c_str(), path.c_str()) != 0) {
    logDebugf("rename to %s failed: %s", path.c_str(), std::strerror(errno));
    return false;
  }
  guard.keep = true;
  return true;
}

// Path redaction helper: show only filename in non-debug logs, full path in debug
std::string redactPath(const std::string& path) {
  if (gDebugEnabled) {
    return path;
  }
  std::filesystem::path p(path);
  return p.filename().string();
}

void outPrintf(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vfprintf(stdout, fmt, args);
  va_end(args);
}
