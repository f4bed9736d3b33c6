#include "pila/panic.h"

#include <inttypes.h>
#include <stdio.h>

#include "pila/errors.hpp"
#include "pila/internal/vm.h"  // For Vm struct definition
#include "pila/panic.hpp"
#include "pila/program.hpp"
#include "pila/vm_api.hpp"

void vm_set_panic_handler(struct Vm *vm, PilaPanicHandler handler, void *user_data)
{
  if (!vm)
    return;

  vm->panic_handler = handler;
  vm->panic_user_data = user_data;
}

void vm_set_panic_quiet(struct Vm *vm, bool quiet)
{
  if (!vm)
    return;

  vm->panic_quiet = quiet;
}

static const char *frame_name(const Vm *vm, uint16_t callee)
{
  if (!vm->program)
    return "?";
  const std::string &name = vm->program->symbols.function_name(callee);
  return name.empty() ? "?" : name.c_str();
}

pila_err vm_panic(struct Vm *vm, pila_err error_code)
{
  if (!vm)
    return error_code;

  // Collect panic information
  PilaPanicInfo info = {};
  info.error_code = error_code;
  info.pc = vm_pc(vm);
  info.fp = vm_fp(vm);
  info.ds_depth = (uint32_t)vm_ds_depth_public(vm);
  info.rs_depth = (uint32_t)vm_rs_depth_public(vm);
  info.has_stack_data = (info.ds_depth > 0);

  if (info.has_stack_data)
  {
    info.tos = vm_ds_peek_public(vm, 0);
    if (info.ds_depth >= 2)
      info.nos = vm_ds_peek_public(vm, 1);
  }

  // Top 4 stack values for custom handlers
  for (uint32_t i = 0; i < 4 && i < info.ds_depth; ++i)
  {
    info.stack[i] = vm_ds_peek_public(vm, (int)i);
  }

  if (!vm->panic_quiet)
  {
    printf("\n");
    printf("========== PILA PANIC ==========\n");

    Err err = static_cast<Err>(error_code);
    printf("Error: %s (%s, code=%d)\n", err_str(err), err_name(err), error_code);
    printf("PC: 0x%08" PRIX32 "  FP: %" PRIu32 "\n", info.pc, info.fp);

    printf("Value Stack: [%" PRIu32 "]", info.ds_depth);
    if (info.has_stack_data)
    {
      printf(" TOS=%" PRId32, info.tos);
      if (info.ds_depth >= 2)
        printf(", NOS=%" PRId32, info.nos);
    }
    printf("\n");

    // Call frames, innermost first
    printf("Call Frames: [%" PRIu32 "]\n", info.rs_depth);
    if (info.rs_depth > 0)
    {
      printf("Call trace:\n");

      VmFrame frames[16];
      int count = vm_rs_copy_to_array(vm, frames, 16);
      int skipped = (int)info.rs_depth - count;
      if (skipped > 0)
      {
        // Show the innermost frames when the trace is deep
        count = 0;
        for (uint32_t i = info.rs_depth - 16; i < info.rs_depth; ++i)
          frames[count++] = vm->RS[i];
      }

      for (int i = count - 1; i >= 0; i--)
      {
        printf("  [%d] %s (argc=%" PRIu32 ", return to 0x%08" PRIX32 ")\n", i,
               frame_name(vm, frames[i].callee), frames[i].argc, frames[i].return_pc);
      }

      if (skipped > 0)
        printf("  ... (%d more frames)\n", skipped);
    }

    printf("================================\n");
    printf("\n");
  }

  if (vm->panic_handler)
  {
    vm->panic_handler(vm->panic_user_data, &info);
  }

  return error_code;
}
