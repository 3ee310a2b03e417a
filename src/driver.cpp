// This file implements the command-line driver that configures a compiler
// session, attaches declaration stores and runs the selected frontend action.

#include "compiler_session.h"
#include "frontend_action.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "llvm/Support/raw_ostream.h"

namespace {

bool endsWith(const std::string &value, const char *suffix) {
  size_t len = std::strlen(suffix);
  if (value.size() < len)
    return false;
  return value.compare(value.size() - len, len, suffix) == 0;
}

bool startsWith(const std::string &value, const char *prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string deriveOutputPath(const std::string &sourcePath, FrontendMode mode) {
  std::string stem = sourcePath;
  std::size_t slash = stem.find_last_of("/\\");
  if (slash != std::string::npos)
    stem = stem.substr(slash + 1);
  std::size_t dot = stem.find_last_of('.');
  if (dot != std::string::npos)
    stem = stem.substr(0, dot);
  if (stem.empty())
    stem = "output";
  return stem + (mode == FrontendMode::EmitModule ? ".pcm" : ".pch");
}

void printUsage() {
  fprintf(stderr, "Usage: declcache [options] <file>\n");
  fprintf(stderr, "Options:\n");
  fprintf(stderr, "  -fsyntax-only      Parse and check the input (default)\n");
  fprintf(stderr, "  -emit-pch          Write a precompiled header for the input\n");
  fprintf(stderr, "  -emit-module       Write a precompiled module for the input\n");
  fprintf(stderr, "  -fmodule-name=<n>  Name of the module being built (default: input stem)\n");
  fprintf(stderr, "  -o <file>          Write the declaration store to <file>\n");
  fprintf(stderr, "  -include-pch <file>\n");
  fprintf(stderr, "                     Attach a precompiled header\n");
  fprintf(stderr, "  -fmodule-file=<file>\n");
  fprintf(stderr, "                     Attach a precompiled module (may be repeated)\n");
  fprintf(stderr, "  -I <dir>, -I<dir>  Add <dir> to the include search path\n");
  fprintf(stderr, "  -dump-deserialized-decls\n");
  fprintf(stderr, "                     Print every declaration read from a store\n");
  fprintf(stderr, "  -ast-dump          Print the AST of the translation unit\n");
  fprintf(stderr, "  -print-stats       Print declaration store statistics\n");
  fprintf(stderr, "  -fno-validate-pch  Do not check store input files for changes\n");
  fprintf(stderr, "  -fno-lazy-load     Read every stored declaration up front\n");
  fprintf(stderr, "  -cc1, -std=<std>   Accepted and ignored\n");
}

// DECLCACHE_* switches are on when set, unless the value is 0, false or off.
bool isEnvSwitchEnabled(const char *name) {
  const char *env = std::getenv(name);
  if (!env)
    return false;

  while (std::isspace(static_cast<unsigned char>(*env)))
    ++env;
  if (*env == '\0')
    return true;

  std::string lowered;
  lowered.reserve(std::strlen(env));
  for (const char *ptr = env; *ptr; ++ptr)
    lowered.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(*ptr))));

  if (lowered == "0" || lowered == "false" || lowered == "off")
    return false;
  return true;
}

} // namespace

int main(int argc, char **argv) {
  CompilerSession session;
  session.resetAll();
  ScopedCompilerSession activeSession(session);

  FrontendOptions &opts = session.options();
  opts.serializationDebug = isEnvSwitchEnabled("DECLCACHE_SERIALIZATION_DEBUG");
  opts.printStats = isEnvSwitchEnabled("DECLCACHE_STATS");

  std::vector<std::string> sourceFiles;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-cc1" || startsWith(arg, "-std=")) {
      if (startsWith(arg, "-std="))
        opts.languageStandard = arg.substr(std::strlen("-std="));
    } else if (arg == "-fsyntax-only") {
      opts.mode = FrontendMode::SyntaxOnly;
    } else if (arg == "-emit-pch") {
      opts.mode = FrontendMode::EmitPCH;
    } else if (arg == "-emit-module") {
      opts.mode = FrontendMode::EmitModule;
    } else if (startsWith(arg, "-fmodule-name=")) {
      opts.moduleName = arg.substr(std::strlen("-fmodule-name="));
    } else if (arg == "-o") {
      if (i + 1 >= argc) {
        fprintf(stderr, "Error: -o requires an output path\n");
        printUsage();
        return 1;
      }
      opts.outputFile = argv[++i];
    } else if (arg == "-include-pch") {
      if (i + 1 >= argc) {
        fprintf(stderr, "Error: -include-pch requires a file\n");
        printUsage();
        return 1;
      }
      if (!opts.includePCH.empty()) {
        fprintf(stderr, "Error: only one precompiled header may be included\n");
        return 1;
      }
      opts.includePCH = argv[++i];
    } else if (startsWith(arg, "-fmodule-file=")) {
      std::string value = arg.substr(std::strlen("-fmodule-file="));
      if (value.empty()) {
        fprintf(stderr, "Error: -fmodule-file= requires a file\n");
        return 1;
      }
      opts.moduleFiles.push_back(value);
    } else if (arg == "-I") {
      if (i + 1 >= argc) {
        fprintf(stderr, "Error: -I requires a directory\n");
        printUsage();
        return 1;
      }
      session.files().includePaths().push_back(argv[++i]);
    } else if (startsWith(arg, "-I")) {
      session.files().includePaths().push_back(arg.substr(2));
    } else if (arg == "-dump-deserialized-decls") {
      opts.dumpDeserializedDecls = true;
    } else if (arg == "-ast-dump") {
      opts.astDump = true;
    } else if (arg == "-print-stats") {
      opts.printStats = true;
    } else if (arg == "-fno-validate-pch") {
      opts.validateInputFiles = false;
    } else if (arg == "-fno-lazy-load") {
      opts.lazyLoad = false;
    } else if (arg == "-h" || arg == "--help") {
      printUsage();
      return 0;
    } else if (!arg.empty() && arg[0] == '-') {
      fprintf(stderr, "Error: Unknown option '%s'\n", arg.c_str());
      printUsage();
      return 1;
    } else {
      sourceFiles.push_back(arg);
    }
  }

  if (sourceFiles.empty()) {
    fprintf(stderr, "Error: no input file\n");
    printUsage();
    return 1;
  }
  if (sourceFiles.size() > 1) {
    fprintf(stderr, "Error: only one input file may be given\n");
    return 1;
  }
  opts.inputFile = sourceFiles.front();

  if (opts.mode != FrontendMode::SyntaxOnly && opts.outputFile.empty())
    opts.outputFile = deriveOutputPath(opts.inputFile, opts.mode);
  if (opts.mode == FrontendMode::SyntaxOnly && !opts.outputFile.empty() &&
      (endsWith(opts.outputFile, ".pch") || endsWith(opts.outputFile, ".pcm")))
    fprintf(stderr, "Warning: -o '%s' is ignored without -emit-pch or -emit-module\n",
            opts.outputFile.c_str());

  bool ok = runFrontendAction(session);
  llvm::errs().flush();
  return ok ? 0 : 1;
}
