#include "frontend_action.h"

#include <cstdio>
#include <memory>
#include <string>

#include "analysis/completeness.h"
#include "analysis/semantics.h"
#include "ast/ast_context.h"
#include "ast/ast_dumper.h"
#include "ast/decl.h"
#include "compiler_session.h"
#include "parser.h"
#include "serialization/decl_store_writer.h"
#include "serialization/deserialization_listener.h"
#include "serialization/lazy_loader.h"
#include "toplevel.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/Path.h"

using namespace serialization;

namespace {

bool reportStoreError(llvm::Error err, const std::string &path) {
  std::string message = llvm::toString(std::move(err));
  reportCompilerErrorAt(SourceLocation{}, "unable to load '" + path + "': " + message);
  return false;
}

} // namespace

bool attachDeclStores(CompilerSession &session) {
  FrontendOptions &opts = session.options();
  if (opts.includePCH.empty() && opts.moduleFiles.empty())
    return true;

  LazyDeclLoader &loader = session.loader();
  loader.setValidateInputFiles(opts.validateInputFiles);
  loader.setDebugTrace(opts.serializationDebug);

  if (!opts.includePCH.empty()) {
    if (llvm::Error err = loader.loadStoreFile(opts.includePCH, StoreKind::PCH))
      return reportStoreError(std::move(err), opts.includePCH);
  }
  for (const std::string &path : opts.moduleFiles) {
    if (llvm::Error err = loader.loadStoreFile(path, StoreKind::Module))
      return reportStoreError(std::move(err), path);
  }
  return true;
}

bool parseMainFile(CompilerSession &session) {
  const std::string &path = session.options().inputFile;
  unsigned fileID = session.files().loadFile(path);
  if (fileID == 0 || !session.lexer().enterFile(fileID)) {
    reportCompilerErrorAt(SourceLocation{}, "cannot open file '" + path + "'");
    return false;
  }

  getNextToken();
  MainLoop();
  return !session.parser().hadError;
}

bool emitDeclStore(CompilerSession &session) {
  FrontendOptions &opts = session.options();
  if (opts.outputFile.empty()) {
    reportCompilerErrorAt(SourceLocation{}, "no output file given for the declaration store");
    return false;
  }
  // Stored declarations would have to be re-emitted with their origin, which
  // the store format does not record.
  if (session.hasLoader() && session.loader().getNumStores() != 0) {
    reportCompilerErrorAt(SourceLocation{},
                          "cannot emit a declaration store while another one is attached");
    return false;
  }

  StoreKind kind =
      opts.mode == FrontendMode::EmitModule ? StoreKind::Module : StoreKind::PCH;
  // Without -fmodule-name a module is named after its input file.
  std::string moduleName = opts.moduleName;
  if (kind == StoreKind::Module && moduleName.empty())
    moduleName = llvm::sys::path::stem(opts.inputFile).str();

  DeclStoreWriter writer(session.astContext(), session.files(), kind, moduleName);
  writer.setDebugTrace(opts.serializationDebug);
  if (llvm::Error err = writer.writeToFile(opts.outputFile, opts.inputFile)) {
    reportCompilerErrorAt(SourceLocation{}, "unable to write '" + opts.outputFile +
                                                "': " + llvm::toString(std::move(err)));
    return false;
  }

  if (opts.serializationDebug)
    fprintf(stderr, "[serialization] wrote %u declarations to '%s'\n",
            writer.getNumDeclsWritten(), opts.outputFile.c_str());
  return true;
}

void printFrontendStatistics(CompilerSession &session, llvm::raw_ostream &os) {
  os << "\n*** Frontend statistics:\n";
  ParserContext &parser = session.parser();
  os << llvm::format("  %u errors, %u warnings\n", parser.errorCount,
                     parser.warningCount);
  os << llvm::format(
      "  %u record definitions completed on demand\n",
      session.analysis().getCompletenessTrigger().getNumExternalCompletions());
  if (session.hasLoader())
    session.loader().printStatistics(os);
  else
    os << "  no declaration stores attached\n";
}

bool runFrontendAction(CompilerSession &session) {
  FrontendOptions &opts = session.options();

  if (!attachDeclStores(session))
    return false;
  if (session.hasLoader()) {
    if (opts.dumpDeserializedDecls)
      session.loader().addDeserializationListener(
          std::make_unique<DumpDeserializedDeclsListener>(llvm::outs()));
    if (!opts.lazyLoad)
      session.loader().loadAllDeclarations();
  }

  bool ok = parseMainFile(session);

  if (ok && opts.mode != FrontendMode::SyntaxOnly)
    ok = emitDeclStore(session);

  if (opts.astDump) {
    ASTDumper astDumper(llvm::outs());
    astDumper.dumpDecl(session.astContext().getTranslationUnitDecl());
  }
  if (opts.printStats)
    printFrontendStatistics(session, llvm::errs());

  llvm::outs().flush();
  return ok && !session.parser().hadError;
}
