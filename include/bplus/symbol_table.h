#ifndef BPLUS_SYMBOL_TABLE_H
#define BPLUS_SYMBOL_TABLE_H

#include "llvm/ADT/SetVector.h"
#include "llvm/ADT/StringRef.h"
#include <set>
#include <string>
#include <vector>

namespace bplus {

/// SymbolTable - The set of variable names seen so far, kept in insertion
/// order. There is no scoping: one flat namespace for the whole program.
class SymbolTable {
public:
  bool isDefined(llvm::StringRef Name) const {
    return Names.count(Name.str()) != 0;
  }

  /// define - Returns false if the name was already present.
  bool define(llvm::StringRef Name) { return Names.insert(Name.str()); }

  size_t size() const { return Names.size(); }
  auto begin() const { return Names.begin(); }
  auto end() const { return Names.end(); }

private:
  llvm::SetVector<std::string, std::vector<std::string>,
                  std::set<std::string>>
      Names;
};

} // end namespace bplus

#endif // BPLUS_SYMBOL_TABLE_H
