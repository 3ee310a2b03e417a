#ifndef TOPLEVEL_H
#define TOPLEVEL_H

// Top-level parsing handlers
void HandleNamespaceDefinition();
void HandleRecordDeclaration();
void HandleEnumDeclaration();
void HandleTypedefDeclaration();
void HandleAliasDeclaration();
void HandleDeclaration();
void MainLoop();

#endif // TOPLEVEL_H
