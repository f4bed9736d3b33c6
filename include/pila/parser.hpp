#pragma once
#include <vector>

#include "pila/ast.hpp"
#include "pila/diagnostic.hpp"
#include "pila/lexer.hpp"

namespace pila
{

/**
 * @brief Recursive-descent parse of a token stream into statements.
 * @return UnexpectedToken / UnexpectedEnd on the first malformed construct.
 */
CompileErr parse(const std::vector<LexToken>& tokens, Ast* out, CompileDiag* diag);

}  // namespace pila
