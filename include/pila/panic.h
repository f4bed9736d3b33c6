#pragma once
#include <stdbool.h>
#include <stdint.h>

#include "pila/vm_api.hpp"

/**
 * @brief VM panic diagnostic information
 *
 * Collected by vm_panic() when the VM stops on a fatal error.
 */
typedef struct PilaPanicInfo
{
  int32_t error_code;  /**< Error code (Err enumeration value) */
  uint32_t pc;         /**< Program counter (byte offset) at the fault */
  uint32_t fp;         /**< Frame pointer at the fault */
  int32_t tos;         /**< Top of Stack (when valid) */
  int32_t nos;         /**< Next on Stack (when valid) */
  uint32_t ds_depth;   /**< Value stack depth */
  uint32_t rs_depth;   /**< Call-frame stack depth */
  bool has_stack_data; /**< Whether stack data is valid */
  int32_t stack[4];    /**< Top 4 stack values (when available) */
} PilaPanicInfo;

/**
 * @brief Panic handler callback type
 *
 * @param user_data  User data pointer passed to vm_set_panic_handler
 * @param info       Panic diagnostic information
 */
typedef void (*PilaPanicHandler)(void *user_data, const PilaPanicInfo *info);

/**
 * @brief Set custom panic handler
 *
 * @param vm         VM instance
 * @param handler    Panic handler callback (NULL to disable)
 * @param user_data  User data passed to handler
 */
void vm_set_panic_handler(struct Vm *vm, PilaPanicHandler handler, void *user_data);

/**
 * @brief Report a fatal error
 *
 * Prints a diagnostic dump (error, pc, stacks, call trace) to stdout unless
 * the VM was configured quiet, then calls the registered handler.
 *
 * @return error_code, for `return vm_panic(vm, e);`
 */
pila_err vm_panic(struct Vm *vm, pila_err error_code);

/**
 * @brief Enable or disable the stdout dump (handler is always called).
 */
void vm_set_panic_quiet(struct Vm *vm, bool quiet);
