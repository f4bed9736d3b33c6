#pragma once
#include <cstddef>
#include <cstdint>

namespace pila
{

/** Opcode set (single byte). Immediates are little-endian. */
enum class Op : std::uint8_t
{
#define OP(name, val, _) name = val,
#include "pila/opcodes.def"
#undef OP
};

// -----------------------------------------------------------------------------
// Operand layout classification for table-driven emit / decode
// -----------------------------------------------------------------------------
enum class OperandKind : uint8_t
{
  NoImm,          // e.g., ADD, RET, DROP
  Imm32,          // LIT imm32
  Off16,          // LGET off16 (signed, relative to fp)
  Slot16,         // LSET slot16
  Slot16Off16,    // BIND slot16 off16
  Label16,        // JMP/JZ label16
  Func16Argc8,    // CALL fn16 argc8
  Builtin8Argc8,  // SYS id8 argc8
};

// -----------------------------------------------------------------------------
// Opcode entry definition
// -----------------------------------------------------------------------------
struct OpInfo
{
  const char* name;
  uint8_t opcode;
  OperandKind kind;
};

#define PILA_OPERAND_NO_IMM OperandKind::NoImm
#define PILA_OPERAND_IMM32 OperandKind::Imm32
#define PILA_OPERAND_OFF16 OperandKind::Off16
#define PILA_OPERAND_SLOT16 OperandKind::Slot16
#define PILA_OPERAND_SLOT16_OFF16 OperandKind::Slot16Off16
#define PILA_OPERAND_LABEL16 OperandKind::Label16
#define PILA_OPERAND_FUNC16_ARGC8 OperandKind::Func16Argc8
#define PILA_OPERAND_BUILTIN8_ARGC8 OperandKind::Builtin8Argc8

// -----------------------------------------------------------------------------
// Opcode table (generated from opcodes.def)
// -----------------------------------------------------------------------------
static constexpr OpInfo kOpTable[] = {
#define OP(name, val, kind) {#name, val, PILA_OPERAND_##kind},
#include "pila/opcodes.def"
#undef OP
};

static constexpr size_t kOpCount = sizeof(kOpTable) / sizeof(kOpTable[0]);

/** Number of immediate bytes following the opcode byte. */
constexpr size_t operand_size(OperandKind kind)
{
  switch (kind)
  {
    case OperandKind::NoImm:
      return 0;
    case OperandKind::Imm32:
      return 4;
    case OperandKind::Off16:
    case OperandKind::Slot16:
    case OperandKind::Label16:
    case OperandKind::Builtin8Argc8:
      return 2;
    case OperandKind::Slot16Off16:
      return 4;
    case OperandKind::Func16Argc8:
      return 3;
  }
  return 0;
}

/** Table lookup by opcode byte; nullptr for bytes that are not opcodes. */
inline const OpInfo* find_op_info(uint8_t opcode)
{
  for (size_t i = 0; i < kOpCount; ++i)
  {
    if (kOpTable[i].opcode == opcode)
      return &kOpTable[i];
  }
  return nullptr;
}

}  // namespace pila
