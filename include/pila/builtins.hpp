#pragma once
#include <cstdint>

#include "pila/builtins.h"
#include "pila/vm_api.hpp"

namespace pila
{

struct BuiltinEntry
{
  const char* name;
  uint8_t id;
};

static constexpr BuiltinEntry kBuiltinTable[] = {
    {"print", PILA_BUILTIN_PRINT},
};

/**
 * @brief Find a builtin by source name.
 * @param name  Identifier text at the call site.
 * @param out   Builtin id (written only when found).
 * @return true if `name` names a builtin.
 */
bool find_builtin(const char* name, uint8_t* out);

/** Source name of a builtin id, or nullptr for an unknown id. */
const char* builtin_name(uint8_t id);

}  // namespace pila

/**
 * @brief Execute builtin `id` with `argc` arguments on the value stack.
 *
 * Pops exactly `argc` values and pushes one result value.
 *
 * @return 0 on success, negative error code on failure.
 */
pila_err vm_builtin(Vm* vm, uint8_t id, uint8_t argc);
