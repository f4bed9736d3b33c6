#include "pila/symbols.hpp"

#include <cstdio>

namespace pila
{

static const std::string kEmptyName;

/* ============================== Labels =================================== */

CompileErr SymbolTable::new_label(const char* prefix, uint32_t hint, Label* out)
{
  if (labels_.size() >= kMaxSymbols)
    return CompileErr::TooManySymbols;

  char name[64];
  snprintf(name, sizeof(name), "%s_%u", prefix, (unsigned)hint);

  out->id = static_cast<uint16_t>(labels_.size());
  labels_.push_back(Entry{name, Symbol{}});
  return CompileErr::OK;
}

void SymbolTable::bind_label(Label label, uint32_t location)
{
  if (label.id < labels_.size())
    labels_[label.id].symbol.location = location;
}

const Symbol* SymbolTable::label(uint16_t id) const
{
  if (id >= labels_.size())
    return nullptr;
  return &labels_[id].symbol;
}

const std::string& SymbolTable::label_name(uint16_t id) const
{
  if (id >= labels_.size())
    return kEmptyName;
  return labels_[id].name;
}

/* ============================= Functions ================================= */

CompileErr SymbolTable::declare_function(const std::string& name, uint16_t arity,
                                         FunctionId* out)
{
  if (function_index_.count(name))
    return CompileErr::DuplicateFunction;
  if (functions_.size() >= kMaxSymbols)
    return CompileErr::TooManySymbols;

  uint16_t id = static_cast<uint16_t>(functions_.size());
  Symbol sym;
  sym.arity = arity;
  functions_.push_back(Entry{name, sym});
  function_index_[name] = id;
  out->id = id;
  return CompileErr::OK;
}

void SymbolTable::bind_function(FunctionId fn, uint32_t location)
{
  if (fn.id < functions_.size())
    functions_[fn.id].symbol.location = location;
}

void SymbolTable::set_local_count(FunctionId fn, uint16_t local_count)
{
  if (fn.id < functions_.size())
    functions_[fn.id].symbol.local_count = local_count;
}

bool SymbolTable::find_function(const std::string& name, FunctionId* out) const
{
  auto it = function_index_.find(name);
  if (it == function_index_.end())
    return false;
  out->id = it->second;
  return true;
}

const Symbol* SymbolTable::function(uint16_t id) const
{
  if (id >= functions_.size())
    return nullptr;
  return &functions_[id].symbol;
}

const std::string& SymbolTable::function_name(uint16_t id) const
{
  if (id >= functions_.size())
    return kEmptyName;
  return functions_[id].name;
}

/* ============================= Resolution ================================ */

bool SymbolTable::lookup(const std::string& name, Symbol* out) const
{
  FunctionId fn;
  if (find_function(name, &fn))
  {
    *out = functions_[fn.id].symbol;
    return true;
  }

  // Labels are few per function; linear search is fine here.
  for (const Entry& e : labels_)
  {
    if (e.name == name)
    {
      *out = e.symbol;
      return true;
    }
  }
  return false;
}

CompileErr SymbolTable::verify(std::string* unbound_name) const
{
  for (const Entry& e : functions_)
  {
    if (e.symbol.location == kUnbound)
    {
      if (unbound_name)
        *unbound_name = e.name;
      return CompileErr::UnboundSymbol;
    }
  }
  for (const Entry& e : labels_)
  {
    if (e.symbol.location == kUnbound)
    {
      if (unbound_name)
        *unbound_name = e.name;
      return CompileErr::UnboundSymbol;
    }
  }
  return CompileErr::OK;
}

void SymbolTable::clear()
{
  labels_.clear();
  functions_.clear();
  function_index_.clear();
}

}  // namespace pila
