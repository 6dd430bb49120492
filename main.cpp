/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <string>

#include "js_parser.h"
#include "logging.h"
#include "unpacker.h"
#include "utils.h"

static void usage(const char* prog) {
  std::fprintf(stderr, "System.register bundle unpacker and control-flow cleaner\n\n");
  std::fprintf(stderr, "USAGE:\n");
  std::fprintf(stderr, "  %s [OPTIONS] file.js\n\n", prog);
  std::fprintf(stderr, "OPTIONS:\n");
  std::fprintf(stderr, "  -v, --debug              Enable debug output\n");
  std::fprintf(stderr, "      --no-extract         Keep System.register calls in place\n");
  std::fprintf(stderr, "      --no-fold            Do not fold constant if-conditions\n");
  std::fprintf(stderr, "      --no-reorder         Do not recover switch dispatch order\n");
  std::fprintf(stderr, "  -n, --dry-run            Run all passes and report, write nothing\n");
  std::fprintf(stderr, "  -h, --help               Show this help message\n\n");
  std::fprintf(stderr, "EXAMPLES:\n");
  std::fprintf(stderr, "  %s bundle.js                   # Extract modules, write bundle_modified.js\n", prog);
  std::fprintf(stderr, "  %s --debug bundle.js           # Debug output\n", prog);
  std::fprintf(stderr, "  %s --no-extract bundle.js      # Only clean up control flow\n", prog);
}

// Returns the number of failed writes
static int writeOutputs(const std::string& inputPath, const UnpackResult& result,
                        const std::string& mainPath) {
  int failures = 0;
  for (const auto& a : result.artifacts) {
    std::string path = siblingPath(inputPath, a.fileName);
    if (writeFileAtomic(path, a.content)) {
      logDebugf("wrote %s (%zu bytes)", path.c_str(), a.content.size());
    } else {
      logErrorf("failed to write %s", redactPath(path).c_str());
      ++failures;
    }
  }

  if (writeFileAtomic(mainPath, result.output)) {
    logDebugf("wrote %s (%zu bytes)", mainPath.c_str(), result.output.size());
  } else {
    logErrorf("failed to write %s", redactPath(mainPath).c_str());
    ++failures;
  }
  return failures;
}

static void printSummary(const UnpackResult& result, const std::string& mainPath, bool dryRun) {
  const char* verb = dryRun ? "would create" : "created";
  for (const auto& a : result.artifacts) {
    outPrintf("%s %s (%s)\n", verb, a.fileName.c_str(), a.symbol.c_str());
  }
  outPrintf("modules: %zu extracted, %zu skipped\n", result.artifacts.size(), result.skippedCalls);
  outPrintf("conditions folded: %zu\n", result.foldedConditions);
  outPrintf("loops reordered: %zu\n", result.reorderedLoops);
  outPrintf("%s %s\n", dryRun ? "would write" : "wrote", redactPath(mainPath).c_str());
}

int main(int argc, char** argv) {
  const char* prog = argv[0];

  // Enable debug if JSUNPACK_DEBUG is set and not "0"
  const char* envdbg = std::getenv("JSUNPACK_DEBUG");
  if (envdbg && envdbg[0] && strcmp(envdbg, "0") != 0) gDebugEnabled = true;

  UnpackOptions options;
  bool dryRun = false;

  enum {
    OPT_NO_EXTRACT = 1000,
    OPT_NO_FOLD,
    OPT_NO_REORDER
  };

  static struct option long_options[] = {
    {"debug",      no_argument, 0, 'v'},
    {"no-extract", no_argument, 0, OPT_NO_EXTRACT},
    {"no-fold",    no_argument, 0, OPT_NO_FOLD},
    {"no-reorder", no_argument, 0, OPT_NO_REORDER},
    {"dry-run",    no_argument, 0, 'n'},
    {"help",       no_argument, 0, 'h'},
    {0, 0, 0, 0}
  };

  int c;
  int option_index = 0;

  while ((c = getopt_long(argc, argv, "vnh", long_options, &option_index)) != -1) {
    switch (c) {
      case 'v':
        gDebugEnabled = true;
        break;
      case 'n':
        dryRun = true;
        break;
      case 'h':
        usage(prog);
        return 0;
      case OPT_NO_EXTRACT:
        options.extract = false;
        break;
      case OPT_NO_FOLD:
        options.fold = false;
        break;
      case OPT_NO_REORDER:
        options.reorder = false;
        break;
      case '?':
        // getopt_long already printed an error message
        usage(prog);
        return 2;
      default:
        logErrorf("Internal error: unhandled option %d", c);
        return 2;
    }
  }

  if (optind != argc - 1) {
    if (optind == argc) {
      logErrorf("Missing input file");
    } else {
      logErrorf("Too many arguments");
    }
    usage(prog);
    return 2;
  }

  std::string inputPath = argv[optind];
  std::string mainPath = modifiedPathFor(inputPath);
  logDebugf("args: file=%s extract=%d fold=%d reorder=%d dry-run=%d", inputPath.c_str(),
            options.extract, options.fold, options.reorder, dryRun);

  if (!fileExists(inputPath)) {
    logErrorf("no such file: %s", redactPath(inputPath).c_str());
    return 1;
  }

  std::string source;
  if (!readFile(inputPath, source)) {
    logErrorf("read failed for %s", redactPath(inputPath).c_str());
    return 1;
  }
  logDebugf("read %zu bytes from %s", source.size(), inputPath.c_str());

  JsParser parser;
  std::string error;
  if (!parser.init(error)) {
    logErrorf("%s", error.c_str());
    return 1;
  }

  UnpackResult result;
  if (!unpackSource(parser, source, options, result, error)) {
    logErrorf("%s: %s", redactPath(inputPath).c_str(), error.c_str());
    flushDeferredWarnings();
    return 1;
  }

  int failures = dryRun ? 0 : writeOutputs(inputPath, result, mainPath);
  printSummary(result, mainPath, dryRun);
  fflush(stdout);

  // Per-item notices come after the summary
  flushDeferredWarnings();
  fflush(stderr);

  logDebugf("done");
  return failures ? 1 : 0;
}
