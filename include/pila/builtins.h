#pragma once

/**
 * @file builtins.h
 * @brief SYS instruction builtin IDs
 *
 * Builtins are host operations reached through the SYS opcode. They are
 * resolved by name at the call site and never enter the symbol table.
 */

/* Console output (0x00 - 0x0F) */
#define PILA_BUILTIN_PRINT 0x00 /**< Pop argc values, write them in source order */
