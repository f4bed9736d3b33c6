#pragma once
#include <cstdint>
#include <vector>

#include "pila/symbols.hpp"

namespace pila
{

/**
 * @brief A compiled program: bytecode plus its symbol table.
 *
 * Filled by compile(); read-only for the VM and the disassembler.
 */
struct Program
{
  std::vector<uint8_t> code;
  SymbolTable symbols;
  uint32_t top_local_count = 0;  ///< Slots reserved at fp = 0 before the first instruction

  void clear()
  {
    code.clear();
    symbols.clear();
    top_local_count = 0;
  }
};

}  // namespace pila
