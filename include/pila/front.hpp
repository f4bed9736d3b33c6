#pragma once
#include <string>

#include "pila/compile.hpp"
#include "pila/diagnostic.hpp"
#include "pila/program.hpp"

namespace pila
{

/**
 * @brief Lex, parse and compile a source string in one call.
 * @param source  Program text.
 * @param out     Compiled program (cleared first).
 * @param diag    Optional first-error report from whichever stage failed.
 */
CompileErr compile_source(const std::string& source, Program* out, CompileDiag* diag);

}  // namespace pila
