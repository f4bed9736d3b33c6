#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "pila/ast.hpp"
#include "pila/diagnostic.hpp"

namespace pila
{

enum class TokenKind : uint8_t
{
  Identifier,
  Syntax,
  Keyword,
  Number,
};

struct LexToken
{
  TokenKind kind = TokenKind::Syntax;
  Token token;
};

/**
 * @brief Split source text into tokens.
 * @return UnexpectedChar (with location) on a character no rule accepts.
 */
CompileErr lex(const std::string& source, std::vector<LexToken>* out, CompileDiag* diag);

const char* token_kind_str(TokenKind kind);

}  // namespace pila
