//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/SymbolTable.hpp
// Purpose: Per-block symbol tables stored in an arena and chained by index.
// Key invariants: Names are unique within one table; table 0 is the global
//                 table and has no parent; lookup walks parents outward.
// Ownership/Lifetime: The arena owns every table; blocks hold indices only.
// Links: frontend/AST.hpp, frontend/SemanticAnalyzer.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/Type.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

namespace shade::frontend
{

/// @brief Index of a SymbolTable inside its arena.
using ScopeId = uint32_t;

inline constexpr ScopeId kNoScope = std::numeric_limits<ScopeId>::max();

/// @brief What a table knows about one binding.
struct SymbolEntry
{
    Type type = Type::Unknown;
    bool isShadowing = false;   ///< Introduced with 'shadow'
    std::string storage;        ///< Unique assembly symbol holding the value
    support::SourceLoc declLoc; ///< First assignment or shadow declaration
};

/// @brief Name to entry mapping for one block.
/// @details Keeps declaration order so code generation is deterministic.
class SymbolTable
{
  public:
    explicit SymbolTable(ScopeId parent) : parent_(parent) {}

    [[nodiscard]] ScopeId parent() const
    {
        return parent_;
    }

    SymbolEntry *find(const std::string &name);
    const SymbolEntry *find(const std::string &name) const;

    /// @brief Insert @p entry under @p name.
    /// @return False, leaving the table unchanged, when @p name already exists.
    bool declare(const std::string &name, SymbolEntry entry);

    /// @brief Names in declaration order.
    [[nodiscard]] const std::vector<std::string> &names() const
    {
        return order_;
    }

    [[nodiscard]] size_t size() const
    {
        return order_.size();
    }

  private:
    ScopeId parent_;
    std::unordered_map<std::string, SymbolEntry> entries_;
    std::vector<std::string> order_;
};

/// @brief Owns all symbol tables of a program.
class SymbolTableArena
{
  public:
    /// @brief Append a fresh table whose parent is @p parent.
    ScopeId create(ScopeId parent);

    SymbolTable &at(ScopeId id);
    const SymbolTable &at(ScopeId id) const;

    [[nodiscard]] bool contains(ScopeId id) const
    {
        return id < tables_.size();
    }

    [[nodiscard]] size_t size() const
    {
        return tables_.size();
    }

    /// @brief Find @p name starting at @p from and walking parent links.
    /// @return Entry of the innermost binding, or nullptr when unresolved.
    SymbolEntry *lookup(ScopeId from, const std::string &name);
    const SymbolEntry *lookup(ScopeId from, const std::string &name) const;

  private:
    std::vector<SymbolTable> tables_;
};

} // namespace shade::frontend
