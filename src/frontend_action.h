#ifndef DECLCACHE_FRONTEND_ACTION_H
#define DECLCACHE_FRONTEND_ACTION_H

#include "llvm/Support/raw_ostream.h"

class CompilerSession;

/// Attach the precompiled header and module files named by the session's
/// options. Returns false after diagnosing the first store that fails to
/// load.
bool attachDeclStores(CompilerSession &session);

/// Lex and parse the main input of the session into its AST.
bool parseMainFile(CompilerSession &session);

/// Serialize the parsed unit to the output named by the options.
bool emitDeclStore(CompilerSession &session);

void printFrontendStatistics(CompilerSession &session, llvm::raw_ostream &os);

/// Run the action selected by the session's options on its input file: attach
/// stores, parse, then dump, emit or print statistics as requested. The
/// session must be the current one. Returns true when no error was reported.
bool runFrontendAction(CompilerSession &session);

#endif // DECLCACHE_FRONTEND_ACTION_H
