#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <new>

#include "pila/builtins.hpp"
#include "pila/errors.hpp"
#include "pila/internal/vm.h"
#include "pila/opcodes.hpp"
#include "pila/panic.h"
#include "pila/program.hpp"
#include "pila/vm_api.hpp"

#if PILA_TRACE_EXECUTION
#include <string>

#include "pila/disasm.hpp"
#endif

using pila::Op;

int pila_vm_version(void)
{
  return 0;
}

static void stdout_write(void *, const char *text, size_t len)
{
  fwrite(text, 1, len, stdout);
}

/* ============================== Lifecycle ================================ */

Vm *vm_create(const VmConfig *cfg)
{
  Vm *vm = new (std::nothrow) Vm{};
  if (!vm)
    return nullptr;

  if (cfg)
  {
    vm->ds_limit = cfg->ds_limit;
    vm->rs_limit = cfg->rs_limit;
    vm->write = cfg->write;
    vm->write_user = cfg->write_user;
  }

  vm_reset(vm);
  return vm;
}

void vm_destroy(Vm *vm)
{
  delete vm;
}

void vm_reset_stacks(Vm *vm)
{
  if (!vm)
    return;

  vm->DS.clear();
  vm->RS.clear();
  vm->fp = 0;  // Top-level code runs in the implicit frame at 0
}

static void apply_defaults(Vm *vm)
{
  if (vm->ds_limit == 0)
    vm->ds_limit = PILA_DEFAULT_DS_LIMIT;
  if (vm->rs_limit == 0)
    vm->rs_limit = PILA_DEFAULT_RS_LIMIT;
  if (!vm->write)
    vm->write = stdout_write;
}

void vm_reset(Vm *vm)
{
  if (!vm)
    return;

  vm_reset_stacks(vm);
  vm->pc = 0;
  apply_defaults(vm);

  vm->last_err = 0;
  vm->has_result = false;
  vm->result = 0;
  vm->halted = false;
  vm->program = nullptr;
}

/* ========================== Value stack helpers ========================== */

pila_err vm_push(Vm *vm, pila_i32 v)
{
  if (vm->DS.size() >= vm->ds_limit)
    return PILA_ERR(StackOverflow);
  vm->DS.push_back(v);
  return PILA_ERR(OK);
}

pila_err vm_pop(Vm *vm, pila_i32 *out)
{
  if (vm->DS.empty())
    return PILA_ERR(StackUnderflow);
  *out = vm->DS.back();
  vm->DS.pop_back();
  return PILA_ERR(OK);
}

/* ===================== Little-endian readers ============================= */

static inline pila_i32 read_i32_le(const pila_u8 *p)
{
  return (pila_i32)((pila_u32)p[0] | ((pila_u32)p[1] << 8) | ((pila_u32)p[2] << 16) |
                    ((pila_u32)p[3] << 24));
}

static inline uint16_t read_u16_le(const pila_u8 *p)
{
  return (uint16_t)((uint16_t)p[0] | ((uint16_t)p[1] << 8));
}

static inline int16_t read_i16_le(const pila_u8 *p)
{
  return (int16_t)read_u16_le(p);
}

/* ========================= Symbol resolution ============================= */

static pila_err resolve_label(const pila::Program *pgm, uint16_t id, pila_u32 *out)
{
  const pila::Symbol *sym = pgm->symbols.label(id);
  if (!sym || sym->location == pila::kUnbound || sym->location > pgm->code.size())
    return PILA_ERR(UnresolvedLabel);
  *out = sym->location;
  return PILA_ERR(OK);
}

static pila_err resolve_function(const pila::Program *pgm, uint16_t id,
                                 const pila::Symbol **out)
{
  const pila::Symbol *sym = pgm->symbols.function(id);
  if (!sym || sym->location == pila::kUnbound || sym->location > pgm->code.size())
    return PILA_ERR(UnresolvedFunction);
  *out = sym;
  return PILA_ERR(OK);
}

/* ========================== Bytecode interpreter ========================= */

static pila_err exec_loop(Vm *vm, const pila::Program *pgm)
{
  const pila_u8 *bc = pgm->code.data();
  const pila_u32 len = (pila_u32)pgm->code.size();

  while (vm->pc < len && !vm->halted)
  {
    const pila_u32 at = vm->pc;
    const pila::OpInfo *info = pila::find_op_info(bc[at]);
    if (!info)
      return PILA_ERR(UnknownOp);

    const pila_u32 width = 1 + (pila_u32)pila::operand_size(info->kind);
    if (at + width > len)
      return PILA_ERR(TruncatedInstruction);

    const pila_u8 *ip = bc + at + 1;
    pila_u32 next = at + width;

#if PILA_TRACE_EXECUTION
    {
      std::string line;
      pila::disasm_one(*pgm, at, line);
      printf("%-40s ds=%zu rs=%zu fp=%u\n", line.c_str(), vm->DS.size(), vm->RS.size(),
             (unsigned)vm->fp);
    }
#endif

    switch (static_cast<Op>(bc[at]))
    {
      /* -------- Literal -------- */
      case Op::LIT:
      {
        if (pila_err e = vm_push(vm, read_i32_le(ip)))
          return e;
        break;
      }

      /* -------- Slots -------- */
      case Op::LGET:
      {
        int64_t idx = (int64_t)vm->fp + read_i16_le(ip);
        if (idx < 0 || idx >= (int64_t)vm->DS.size())
          return PILA_ERR(SlotOutOfRange);
        if (pila_err e = vm_push(vm, vm->DS[(size_t)idx]))
          return e;
        break;
      }

      case Op::BIND:
      {
        // Copy an argument from below the frame base into its parameter slot
        uint16_t slot = read_u16_le(ip);
        int64_t src = (int64_t)vm->fp + read_i16_le(ip + 2);
        size_t dst = (size_t)vm->fp + slot;
        if (src < 0 || src >= (int64_t)vm->fp)
          return PILA_ERR(SlotOutOfRange);
        if (dst >= vm->DS.size())
          return PILA_ERR(SlotOutOfRange);
        vm->DS[dst] = vm->DS[(size_t)src];
        break;
      }

      case Op::LSET:
      {
        uint16_t slot = read_u16_le(ip);
        pila_i32 val;
        if (pila_err e = vm_pop(vm, &val))
          return e;
        size_t idx = (size_t)vm->fp + slot;
        if (idx >= vm->DS.size())
        {
          // Hand-assembled top-level code may not reserve its slots: grow with zeros
          if (idx >= vm->ds_limit)
            return PILA_ERR(StackOverflow);
          vm->DS.resize(idx + 1, 0);
        }
        vm->DS[idx] = val;
        break;
      }

      /* -------- Control flow -------- */
      case Op::JZ:
      {
        pila_u32 tgt;
        if (pila_err e = resolve_label(pgm, read_u16_le(ip), &tgt))
          return e;
        pila_i32 cond;
        if (pila_err e = vm_pop(vm, &cond))
          return e;
        if (cond == 0)
          next = tgt;
        break;
      }

      case Op::JMP:
      {
        pila_u32 tgt;
        if (pila_err e = resolve_label(pgm, read_u16_le(ip), &tgt))
          return e;
        next = tgt;
        break;
      }

      /* -------- Call / Return -------- */
      case Op::CALL:
      {
        uint16_t fn_id = read_u16_le(ip);
        uint8_t argc = ip[2];

        const pila::Symbol *callee;
        if (pila_err e = resolve_function(pgm, fn_id, &callee))
          return e;
        if (argc != callee->arity)
          return PILA_ERR(ArityMismatch);
        if (vm->DS.size() < argc)
          return PILA_ERR(StackUnderflow);
        if (vm->RS.size() >= vm->rs_limit)
          return PILA_ERR(CallDepthExceeded);

        // Arguments stay in place below the new frame base
        VmFrame frame;
        frame.return_pc = next;
        frame.saved_fp = vm->fp;
        frame.argc = argc;
        frame.callee = fn_id;

        size_t base = vm->DS.size();
        if (base + callee->local_count > vm->ds_limit)
          return PILA_ERR(StackOverflow);

        vm->RS.push_back(frame);
        vm->fp = (pila_u32)base;
        vm->DS.resize(base + callee->local_count, 0);
        next = callee->location;
        break;
      }

      case Op::SYS:
      {
        if (pila_err e = vm_builtin(vm, ip[0], ip[1]))
          return e;
        break;
      }

      case Op::RET:
      {
        pila_i32 ret;
        if (pila_err e = vm_pop(vm, &ret))
          return e;

        if (vm->RS.empty())
        {
          // Top-level return ends the program
          vm->has_result = true;
          vm->result = ret;
          vm->halted = true;
          break;
        }

        // Discard locals and pending operands of the callee
        if (vm->DS.size() < vm->fp)
          return PILA_ERR(StackUnderflow);
        vm->DS.resize(vm->fp);

        VmFrame frame = vm->RS.back();
        vm->RS.pop_back();
        vm->fp = frame.saved_fp;

        // Discard the arguments the caller pushed
        if (vm->DS.size() < frame.argc)
          return PILA_ERR(StackUnderflow);
        vm->DS.resize(vm->DS.size() - frame.argc);

        if (pila_err e = vm_push(vm, ret))
          return e;
        next = frame.return_pc;
        break;
      }

      /* -------- Arithmetic -------- */
      case Op::ADD:
      {
        pila_i32 a, b;
        if (pila_err e = vm_pop(vm, &b))
          return e;
        if (pila_err e = vm_pop(vm, &a))
          return e;
        if (pila_err e = vm_push(vm, (pila_i32)((pila_u32)a + (pila_u32)b)))
          return e;
        break;
      }

      case Op::SUB:
      {
        pila_i32 a, b;
        if (pila_err e = vm_pop(vm, &b))
          return e;
        if (pila_err e = vm_pop(vm, &a))
          return e;
        if (pila_err e = vm_push(vm, (pila_i32)((pila_u32)a - (pila_u32)b)))
          return e;
        break;
      }

      case Op::LT:
      {
        pila_i32 a, b;
        if (pila_err e = vm_pop(vm, &b))
          return e;
        if (pila_err e = vm_pop(vm, &a))
          return e;
        if (pila_err e = vm_push(vm, a < b ? 1 : 0))
          return e;
        break;
      }

      /* -------- Stack -------- */
      case Op::DROP:
      {
        pila_i32 dummy;
        if (pila_err e = vm_pop(vm, &dummy))
          return e;
        break;
      }

      default:
        return PILA_ERR(UnknownOp);
    }

    vm->pc = next;
  }

  return PILA_ERR(OK);
}

/* =========================== Public API entry ============================ */

pila_err vm_exec(Vm *vm, const pila::Program *program)
{
  if (!vm || !program)
    return PILA_ERR(InvalidArg);

  apply_defaults(vm);
  vm_reset_stacks(vm);
  vm->program = program;
  vm->pc = 0;
  vm->halted = false;
  vm->has_result = false;
  vm->result = 0;

  // Top-level locals live in the implicit frame at fp = 0, sized up front so
  // a local declared in a skipped if body still owns its slot
  pila_err e = PILA_ERR(OK);
  if (program->top_local_count > vm->ds_limit)
    e = PILA_ERR(StackOverflow);
  else
    vm->DS.resize(program->top_local_count, 0);

  if (!e)
    e = exec_loop(vm, program);
  vm->last_err = e;
  if (e)
    vm_panic(vm, e);

  vm->program = nullptr;
  return e;
}

pila_err vm_result(Vm *vm, pila_i32 *out)
{
  if (!vm || !out || !vm->has_result)
    return PILA_ERR(InvalidArg);
  *out = vm->result;
  return PILA_ERR(OK);
}

pila_err vm_last_error(Vm *vm)
{
  return vm ? vm->last_err : PILA_ERR(InvalidArg);
}

pila_u32 vm_pc(Vm *vm)
{
  return vm ? vm->pc : 0;
}

pila_u32 vm_fp(Vm *vm)
{
  return vm ? vm->fp : 0;
}

/* ======================= Stack inspection API ============================ */

int vm_ds_depth_public(Vm *vm)
{
  if (!vm)
    return 0;
  return (int)vm->DS.size();
}

pila_i32 vm_ds_peek_public(Vm *vm, int index_from_top)
{
  if (!vm)
    return 0;

  int depth = (int)vm->DS.size();
  if (index_from_top < 0 || index_from_top >= depth)
    return 0;  // Out of range

  return vm->DS[(size_t)(depth - 1 - index_from_top)];
}

int vm_ds_copy_to_array(Vm *vm, pila_i32 *out_array, int max_count)
{
  if (!vm || !out_array || max_count <= 0)
    return 0;

  int depth = (int)vm->DS.size();
  int count = (depth < max_count) ? depth : max_count;
  for (int i = 0; i < count; i++)
    out_array[i] = vm->DS[(size_t)i];
  return count;
}

/* ===================== Stack manipulation API ============================ */

pila_err vm_ds_push(Vm *vm, pila_i32 value)
{
  if (!vm)
    return PILA_ERR(InvalidArg);
  return vm_push(vm, value);
}

pila_err vm_ds_pop(Vm *vm, pila_i32 *out_value)
{
  if (!vm)
    return PILA_ERR(InvalidArg);
  pila_i32 dummy;
  return vm_pop(vm, out_value ? out_value : &dummy);
}

void vm_ds_clear(Vm *vm)
{
  if (!vm)
    return;
  vm->DS.clear();
}

/* ==================== Call-frame stack inspection API ==================== */

int vm_rs_depth_public(Vm *vm)
{
  if (!vm)
    return 0;
  return (int)vm->RS.size();
}

int vm_rs_copy_to_array(Vm *vm, VmFrame *out_array, int max_count)
{
  if (!vm || !out_array || max_count <= 0)
    return 0;

  int depth = (int)vm->RS.size();
  int count = (depth < max_count) ? depth : max_count;
  for (int i = 0; i < count; i++)
    out_array[i] = vm->RS[(size_t)i];
  return count;
}
