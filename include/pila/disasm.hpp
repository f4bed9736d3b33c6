#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "pila/program.hpp"

namespace pila
{

/**
 * @brief Disassemble a single instruction at given PC.
 *
 * @param program  Program whose code and symbols are rendered.
 * @param pc       Current byte offset.
 * @param out      Output string (one line, without newline).
 * @return Number of bytes consumed; 0 if pc is at or past the end.
 *
 * Example output: `"0012: JZ if_else_7 ; -> 0020"`
 */
size_t disasm_one(const Program& program, size_t pc, std::string& out);

/**
 * @brief Disassemble the whole program, one line per instruction.
 *        Lines naming a function entry or label address are preceded by a
 *        `name:` line.
 */
std::vector<std::string> disasm_all(const Program& program);

/**
 * @brief Print disassembly to a FILE stream.
 */
void disasm_print(const Program& program, std::FILE* fp);

}  // namespace pila
