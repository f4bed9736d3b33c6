#include "pila/disasm.hpp"

#include <cinttypes>
#include <map>

#include "pila/builtins.hpp"
#include "pila/opcodes.hpp"

namespace pila
{

static inline uint16_t rd16(const uint8_t* p)
{
  return (uint16_t)((uint16_t)p[0] | ((uint16_t)p[1] << 8));
}

static inline int32_t rd32(const uint8_t* p)
{
  return (int32_t)((uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) |
                   ((uint32_t)p[3] << 24));
}

static std::string label_text(const Program& program, uint16_t id, bool* resolved,
                              uint32_t* where)
{
  const Symbol* sym = program.symbols.label(id);
  *resolved = sym && sym->location != kUnbound;
  *where = *resolved ? sym->location : 0;
  const std::string& name = program.symbols.label_name(id);
  if (!name.empty())
    return name;
  return "L" + std::to_string(id);
}

size_t disasm_one(const Program& program, size_t pc, std::string& out)
{
  const std::vector<uint8_t>& code = program.code;
  if (pc >= code.size())
    return 0;

  char buf[160];
  const uint8_t opcode = code[pc];
  const OpInfo* info = find_op_info(opcode);
  if (!info)
  {
    snprintf(buf, sizeof(buf), "%04zu: .byte 0x%02X", pc, opcode);
    out = buf;
    return 1;
  }

  const size_t width = 1 + operand_size(info->kind);
  if (pc + width > code.size())
  {
    snprintf(buf, sizeof(buf), "%04zu: %s <truncated>", pc, info->name);
    out = buf;
    return code.size() - pc;
  }

  const uint8_t* imm = code.data() + pc + 1;
  switch (info->kind)
  {
    case OperandKind::NoImm:
      snprintf(buf, sizeof(buf), "%04zu: %s", pc, info->name);
      break;

    case OperandKind::Imm32:
      snprintf(buf, sizeof(buf), "%04zu: %s %" PRId32, pc, info->name, rd32(imm));
      break;

    case OperandKind::Off16:
      snprintf(buf, sizeof(buf), "%04zu: %s fp%+d", pc, info->name, (int)(int16_t)rd16(imm));
      break;

    case OperandKind::Slot16:
      snprintf(buf, sizeof(buf), "%04zu: %s %u", pc, info->name, (unsigned)rd16(imm));
      break;

    case OperandKind::Slot16Off16:
      snprintf(buf, sizeof(buf), "%04zu: %s %u, fp%+d", pc, info->name, (unsigned)rd16(imm),
               (int)(int16_t)rd16(imm + 2));
      break;

    case OperandKind::Label16:
    {
      bool resolved;
      uint32_t where;
      std::string name = label_text(program, rd16(imm), &resolved, &where);
      if (resolved)
        snprintf(buf, sizeof(buf), "%04zu: %s %s ; -> %04" PRIu32, pc, info->name,
                 name.c_str(), where);
      else
        snprintf(buf, sizeof(buf), "%04zu: %s %s ; -> ?", pc, info->name, name.c_str());
      break;
    }

    case OperandKind::Func16Argc8:
    {
      uint16_t id = rd16(imm);
      const std::string& name = program.symbols.function_name(id);
      if (name.empty())
        snprintf(buf, sizeof(buf), "%04zu: %s #%u, %u", pc, info->name, (unsigned)id,
                 (unsigned)imm[2]);
      else
        snprintf(buf, sizeof(buf), "%04zu: %s %s, %u", pc, info->name, name.c_str(),
                 (unsigned)imm[2]);
      break;
    }

    case OperandKind::Builtin8Argc8:
    {
      const char* name = builtin_name(imm[0]);
      if (name)
        snprintf(buf, sizeof(buf), "%04zu: %s %s, %u", pc, info->name, name, (unsigned)imm[1]);
      else
        snprintf(buf, sizeof(buf), "%04zu: %s 0x%02X, %u", pc, info->name, (unsigned)imm[0],
                 (unsigned)imm[1]);
      break;
    }
  }

  out = buf;
  return width;
}

std::vector<std::string> disasm_all(const Program& program)
{
  // Names bound to each address, functions before labels
  std::multimap<uint32_t, std::string> marks;
  for (size_t i = 0; i < program.symbols.function_count(); ++i)
  {
    const Symbol* sym = program.symbols.function((uint16_t)i);
    if (sym && sym->location != kUnbound)
    {
      const std::string& name = program.symbols.function_name((uint16_t)i);
      marks.emplace(sym->location, name + ": ; arity=" + std::to_string(sym->arity) +
                                       " locals=" + std::to_string(sym->local_count));
    }
  }
  for (size_t i = 0; i < program.symbols.label_count(); ++i)
  {
    const Symbol* sym = program.symbols.label((uint16_t)i);
    if (sym && sym->location != kUnbound)
      marks.emplace(sym->location, program.symbols.label_name((uint16_t)i) + ":");
  }

  std::vector<std::string> lines;
  size_t pc = 0;
  std::string line;
  while (pc <= program.code.size())
  {
    auto range = marks.equal_range((uint32_t)pc);
    for (auto it = range.first; it != range.second; ++it)
      lines.push_back(it->second);

    size_t n = disasm_one(program, pc, line);
    if (n == 0)
      break;
    lines.push_back(line);
    pc += n;
  }
  return lines;
}

void disasm_print(const Program& program, std::FILE* fp)
{
  for (const std::string& line : disasm_all(program))
    std::fprintf(fp, "%s\n", line.c_str());
}

}  // namespace pila
