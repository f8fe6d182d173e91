//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/SymbolTable.cpp
// Purpose: Implements symbol tables and the scope-chain walk.
//
//===----------------------------------------------------------------------===//

#include "frontend/SymbolTable.hpp"

#include <stdexcept>

namespace shade::frontend
{

SymbolEntry *SymbolTable::find(const std::string &name)
{
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
}

const SymbolEntry *SymbolTable::find(const std::string &name) const
{
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
}

bool SymbolTable::declare(const std::string &name, SymbolEntry entry)
{
    auto [it, inserted] = entries_.emplace(name, std::move(entry));
    if (inserted)
        order_.push_back(name);
    return inserted;
}

ScopeId SymbolTableArena::create(ScopeId parent)
{
    tables_.emplace_back(parent);
    return static_cast<ScopeId>(tables_.size() - 1);
}

SymbolTable &SymbolTableArena::at(ScopeId id)
{
    if (!contains(id))
        throw std::out_of_range("symbol table arena: invalid scope id");
    return tables_[id];
}

const SymbolTable &SymbolTableArena::at(ScopeId id) const
{
    if (!contains(id))
        throw std::out_of_range("symbol table arena: invalid scope id");
    return tables_[id];
}

SymbolEntry *SymbolTableArena::lookup(ScopeId from, const std::string &name)
{
    for (ScopeId id = from; contains(id); id = tables_[id].parent())
    {
        if (auto *entry = tables_[id].find(name))
            return entry;
    }
    return nullptr;
}

const SymbolEntry *SymbolTableArena::lookup(ScopeId from, const std::string &name) const
{
    for (ScopeId id = from; contains(id); id = tables_[id].parent())
    {
        if (const auto *entry = tables_[id].find(name))
            return entry;
    }
    return nullptr;
}

} // namespace shade::frontend
