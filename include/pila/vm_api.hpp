/**
 * @file vm_api.hpp
 * @brief pila VM public API
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once
#include <stddef.h>
#include <stdint.h>

/* ------------------------------------------------------------------------- */
/* Basic typedefs                                                            */
/* ------------------------------------------------------------------------- */

/** 32-bit signed integer: the only value type of the language. */
typedef int32_t pila_i32;
/** 32-bit unsigned integer used for addresses and depths. */
typedef uint32_t pila_u32;
/** 16-bit unsigned integer used for slot, label and function ids. */
typedef uint16_t pila_u16;
/** 8-bit unsigned integer used for bytecode. */
typedef uint8_t pila_u8;
/** Error code type. 0 = OK, negative = error. */
typedef int pila_err;

/* ------------------------------------------------------------------------- */
/* VM configuration                                                          */
/* ------------------------------------------------------------------------- */

#define PILA_DEFAULT_DS_LIMIT 4096u
#define PILA_DEFAULT_RS_LIMIT 256u

/**
 * @brief Output sink used by builtins (print).
 * @param user  User-defined context pointer from VmConfig.
 * @param text  Bytes to write (not NUL-terminated).
 * @param len   Number of bytes.
 */
typedef void (*pila_write_fn)(void *user, const char *text, size_t len);

/**
 * @brief Configuration structure used when creating a VM instance.
 *
 * Zero-valued limits select the defaults above. A NULL writer sends builtin
 * output to stdout.
 */
typedef struct VmConfig
{
  pila_u32 ds_limit;   /**< Maximum value stack depth */
  pila_u32 rs_limit;   /**< Maximum call depth (frames) */
  pila_write_fn write; /**< Builtin output sink (can be NULL) */
  void *write_user;    /**< User data passed to write */
} VmConfig;

/**
 * @brief One call-frame record. Lives on the call-frame stack, never on the
 * value stack.
 */
typedef struct VmFrame
{
  pila_u32 return_pc; /**< Byte offset to resume at in the caller */
  pila_u32 saved_fp;  /**< Caller frame base */
  pila_u32 argc;      /**< Arguments to discard below the frame on return */
  pila_u16 callee;    /**< Function id of the callee (for call traces) */
} VmFrame;

/* Forward declarations. */
struct Vm;
namespace pila
{
struct Program;
}

/* ------------------------------------------------------------------------- */
/* Lifecycle and execution                                                   */
/* ------------------------------------------------------------------------- */

/**
 * @brief Create a new VM instance.
 * @param cfg  Configuration (can be NULL for defaults).
 * @return Pointer to the new VM, or NULL on allocation failure.
 */
struct Vm *vm_create(const VmConfig *cfg);

/**
 * @brief Destroy a VM instance.
 * @param vm  VM instance to destroy (NULL-safe).
 */
void vm_destroy(struct Vm *vm);

/**
 * @brief Reset stacks, registers and the recorded result.
 *        Limits and the output writer are preserved; zero limits are replaced
 *        by the defaults.
 * @param vm  VM instance.
 */
void vm_reset(struct Vm *vm);

/**
 * @brief Reset only the value and call-frame stacks.
 * @param vm  VM instance.
 */
void vm_reset_stacks(struct Vm *vm);

/**
 * @brief Execute a compiled program from its first instruction.
 *
 * Clears both stacks, reserves the program's top-level local slots at fp = 0,
 * then runs until pc reaches the end of the code or a top-level RET. Any
 * fatal error stops execution, triggers vm_panic() and is returned; the
 * stacks are left as they were at the fault for inspection.
 *
 * @param vm       VM instance.
 * @param program  Compiled program (must stay alive for the call).
 * @return 0 on success, negative error code on failure.
 */
pila_err vm_exec(struct Vm *vm, const pila::Program *program);

/**
 * @brief Value produced by a top-level `return`.
 * @param vm   VM instance.
 * @param out  Output pointer.
 * @return 0 if a result was recorded, InvalidArg otherwise.
 */
pila_err vm_result(struct Vm *vm, pila_i32 *out);

/** Error code of the last vm_exec() (0 = OK). */
pila_err vm_last_error(struct Vm *vm);

/** Program counter (byte offset) where the VM stopped. */
pila_u32 vm_pc(struct Vm *vm);

/** Current frame pointer (value stack index of the frame base). */
pila_u32 vm_fp(struct Vm *vm);

/* ------------------------------------------------------------------------- */
/* Value stack inspection (for testing and embedding)                        */
/* ------------------------------------------------------------------------- */

/**
 * @brief Get the current value stack depth.
 * @param vm  VM instance.
 * @return Number of values on the stack.
 */
int vm_ds_depth_public(struct Vm *vm);

/**
 * @brief Peek a value by index from the top.
 * @param vm              VM instance.
 * @param index_from_top  0 = top, 1 = next, ...
 * @return Value at the given position, or 0 if out of range.
 */
pila_i32 vm_ds_peek_public(struct Vm *vm, int index_from_top);

/**
 * @brief Copy the value stack to an array, bottom first.
 * @return Number of values copied (0 to max_count).
 */
int vm_ds_copy_to_array(struct Vm *vm, pila_i32 *out_array, int max_count);

/**
 * @brief Push a value onto the value stack.
 * @return 0 on success, StackOverflow past the configured limit.
 */
pila_err vm_ds_push(struct Vm *vm, pila_i32 value);

/**
 * @brief Pop a value from the value stack.
 * @param out_value  Output pointer (can be NULL).
 * @return 0 on success, StackUnderflow on an empty stack.
 */
pila_err vm_ds_pop(struct Vm *vm, pila_i32 *out_value);

/** Clear the value stack. */
void vm_ds_clear(struct Vm *vm);

/* ------------------------------------------------------------------------- */
/* Call-frame stack inspection (for debugging and panic traces)              */
/* ------------------------------------------------------------------------- */

/** Number of active call frames (0 while running top-level code). */
int vm_rs_depth_public(struct Vm *vm);

/**
 * @brief Copy the call-frame stack to an array, outermost frame first.
 * @return Number of frames copied (0 to max_count).
 */
int vm_rs_copy_to_array(struct Vm *vm, VmFrame *out_array, int max_count);

/* ------------------------------------------------------------------------- */
/* Version                                                                   */
/* ------------------------------------------------------------------------- */

/** Current VM version. */
int pila_vm_version(void);

/* ------------------------------------------------------------------------- */
/* Error handling notes                                                      */
/* ------------------------------------------------------------------------- */
/**
 * All APIs return 0 on success and a negative pila_err on failure.
 * Errors are defined in `errors.def` and expanded by `errors.hpp`.
 * Exceptions are never thrown; propagation is purely via return values.
 */
