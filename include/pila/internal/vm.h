#pragma once
#include <vector>

#include "pila/panic.h"
#include "pila/vm_api.hpp"

/**
 * @brief Internal VM structure (not part of the public API).
 *        Visible only for unit tests or tightly coupled components.
 */
struct Vm
{
  std::vector<pila_i32> DS; /**< Value stack: arguments, locals, operands */
  std::vector<VmFrame> RS;  /**< Call-frame stack */
  pila_u32 pc;              /**< Program counter (byte offset into code) */
  pila_u32 fp;              /**< Frame base (index into DS) */

  /* Limits (0 = default, applied by vm_reset) */
  pila_u32 ds_limit;
  pila_u32 rs_limit;

  /* Builtin output */
  pila_write_fn write;
  void *write_user;

  /* Execution state */
  int last_err;       /**< Last error code (0 = OK) */
  bool has_result;    /**< Top-level RET recorded a result */
  pila_i32 result;    /**< Value of the top-level RET */
  bool halted;        /**< Set by top-level RET to stop the loop */
  const pila::Program *program; /**< Program being executed (NULL when idle) */

  /* Panic reporting */
  PilaPanicHandler panic_handler;
  void *panic_user_data;
  bool panic_quiet;
};

/* Internal-only helpers shared by core.cpp and builtins.cpp. */
pila_err vm_push(Vm *vm, pila_i32 v);
pila_err vm_pop(Vm *vm, pila_i32 *out);
