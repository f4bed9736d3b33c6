#include "pila/builtins.hpp"

#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <string>

#include "pila/errors.hpp"
#include "pila/internal/vm.h"

namespace pila
{

bool find_builtin(const char* name, uint8_t* out)
{
  if (!name)
    return false;
  for (const BuiltinEntry& b : kBuiltinTable)
  {
    if (strcmp(b.name, name) == 0)
    {
      *out = b.id;
      return true;
    }
  }
  return false;
}

const char* builtin_name(uint8_t id)
{
  for (const BuiltinEntry& b : kBuiltinTable)
  {
    if (b.id == id)
      return b.name;
  }
  return nullptr;
}

}  // namespace pila

/* ========================================================================= */
/* SYS dispatch                                                              */
/* ========================================================================= */

// (v1 ... vn -- 0): writes "v1 v2 ... vn\n"
static pila_err builtin_print(Vm* vm, uint8_t argc)
{
  if (vm->DS.size() < argc)
    return PILA_ERR(StackUnderflow);

  // The last argument is on top; emit from the deepest one to keep source order
  const size_t base = vm->DS.size() - argc;
  std::string line;
  char num[16];
  for (size_t i = 0; i < argc; i++)
  {
    if (i > 0)
      line += ' ';
    snprintf(num, sizeof(num), "%" PRId32, vm->DS[base + i]);
    line += num;
  }
  line += '\n';
  vm->DS.resize(base);

  if (vm->write)
    vm->write(vm->write_user, line.data(), line.size());
  else
    fwrite(line.data(), 1, line.size(), stdout);

  // Every call expression yields one value
  return vm_push(vm, 0);
}

pila_err vm_builtin(Vm* vm, uint8_t id, uint8_t argc)
{
  switch (id)
  {
    case PILA_BUILTIN_PRINT:
      return builtin_print(vm, argc);

    default:
      return PILA_ERR(UnknownBuiltin);
  }
}
