#include "ast/expr.h"

std::string QualifiedNameRef::getAsString() const {
  std::string Result = Global ? "::" : "";
  for (const std::string &Qualifier : Qualifiers) {
    Result += Qualifier;
    Result += "::";
  }
  Result += Name;
  return Result;
}
