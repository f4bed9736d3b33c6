#include "pila/lexer.hpp"

#include <cctype>
#include <cstring>

namespace pila
{

static const char* const kKeywords[] = {
    "function", "end", "if", "then", "local", "return",
};

// Single-character syntax. Operators beyond + - < are accepted here so the
// compiler can reject them with a located message.
static const char kSyntax[] = ";=+-<(),*/>";

static bool is_ident_start(char c)
{
  return isalpha((unsigned char)c) || c == '_';
}

static bool is_ident_char(char c)
{
  return isalnum((unsigned char)c) || c == '_';
}

static bool is_keyword(const std::string& word)
{
  for (const char* kw : kKeywords)
  {
    if (word == kw)
      return true;
  }
  return false;
}

// Advance one character, tracking line/column
static void increment(const std::string& src, Location* loc)
{
  if (src[loc->index] == '\n')
  {
    loc->line++;
    loc->col = 0;
  }
  else
  {
    loc->col++;
  }
  loc->index++;
}

const char* token_kind_str(TokenKind kind)
{
  switch (kind)
  {
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::Syntax:
      return "syntax";
    case TokenKind::Keyword:
      return "keyword";
    case TokenKind::Number:
      return "number";
  }
  return "unknown";
}

CompileErr lex(const std::string& source, std::vector<LexToken>* out, CompileDiag* diag)
{
  if (!out)
    return CompileErr::MalformedNode;
  out->clear();

  Location loc;
  const size_t size = source.size();

  while (loc.index < size)
  {
    const char c = source[loc.index];

    // Skip whitespace
    if (c == ' ' || c == '\n' || c == '\r' || c == '\t')
    {
      increment(source, &loc);
      continue;
    }

    LexToken tok;
    tok.token.loc = loc;

    if (is_ident_start(c))
    {
      while (loc.index < size && is_ident_char(source[loc.index]))
      {
        tok.token.value.push_back(source[loc.index]);
        increment(source, &loc);
      }
      tok.kind = is_keyword(tok.token.value) ? TokenKind::Keyword : TokenKind::Identifier;
    }
    else if (isdigit((unsigned char)c))
    {
      while (loc.index < size && isdigit((unsigned char)source[loc.index]))
      {
        tok.token.value.push_back(source[loc.index]);
        increment(source, &loc);
      }
      tok.kind = TokenKind::Number;
    }
    else if (c != '\0' && strchr(kSyntax, c))
    {
      tok.token.value.push_back(c);
      tok.kind = TokenKind::Syntax;
      increment(source, &loc);
    }
    else
    {
      out->clear();
      return report(diag, CompileErr::UnexpectedChar, loc, "'" + std::string(1, c) + "'");
    }

    out->push_back(tok);
  }

  return CompileErr::OK;
}

}  // namespace pila
