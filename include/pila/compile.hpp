#pragma once

#include "pila/ast.hpp"
#include "pila/compile_errors.hpp"
#include "pila/diagnostic.hpp"
#include "pila/program.hpp"

namespace pila
{

/**
 * @brief Compile a syntax tree into bytecode.
 *
 * Two passes: every function (at any nesting depth) is declared with its
 * arity first, then code is emitted and each function and label is bound.
 * Fails on the first error; `out` is left empty in that case.
 *
 * @param ast   Statements in source order.
 * @param out   Program to fill (cleared first).
 * @param diag  Optional first-error report.
 * @return CompileErr::OK on success.
 */
CompileErr compile(const Ast& ast, Program* out, CompileDiag* diag);

}  // namespace pila
