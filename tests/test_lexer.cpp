#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "pila/lexer.hpp"

using namespace pila;

TEST_CASE("keywords, identifiers, numbers and syntax")
{
  std::vector<LexToken> toks;
  REQUIRE(lex("function fib(n) return n; end", &toks, nullptr) == CompileErr::OK);
  REQUIRE(toks.size() == 9);

  CHECK(toks[0].kind == TokenKind::Keyword);
  CHECK(toks[0].token.value == "function");
  CHECK(toks[1].kind == TokenKind::Identifier);
  CHECK(toks[1].token.value == "fib");
  CHECK(toks[2].kind == TokenKind::Syntax);
  CHECK(toks[2].token.value == "(");
  CHECK(toks[3].kind == TokenKind::Identifier);
  CHECK(toks[4].token.value == ")");
  CHECK(toks[5].kind == TokenKind::Keyword);
  CHECK(toks[5].token.value == "return");
  CHECK(toks[7].token.value == ";");
  CHECK(toks[8].kind == TokenKind::Keyword);
  CHECK(toks[8].token.value == "end");
}

TEST_CASE("keyword prefixes are identifiers")
{
  std::vector<LexToken> toks;
  REQUIRE(lex("ending iff local_1 _x", &toks, nullptr) == CompileErr::OK);
  REQUIRE(toks.size() == 4);
  for (const LexToken& t : toks)
    CHECK(t.kind == TokenKind::Identifier);
  CHECK(toks[2].token.value == "local_1");
}

TEST_CASE("numbers and operators need no spaces")
{
  std::vector<LexToken> toks;
  REQUIRE(lex("12+345<6-7", &toks, nullptr) == CompileErr::OK);
  REQUIRE(toks.size() == 7);
  CHECK(toks[0].kind == TokenKind::Number);
  CHECK(toks[0].token.value == "12");
  CHECK(toks[1].token.value == "+");
  CHECK(toks[2].token.value == "345");
  CHECK(toks[3].token.value == "<");
  CHECK(toks[5].token.value == "-");
  CHECK(toks[6].kind == TokenKind::Number);
}

TEST_CASE("line and column tracking")
{
  std::vector<LexToken> toks;
  REQUIRE(lex("local a = 1;\n  return a;\r\n\tb", &toks, nullptr) == CompileErr::OK);
  REQUIRE(toks.size() == 9);

  CHECK(toks[0].token.loc.line == 0);
  CHECK(toks[0].token.loc.col == 0);
  CHECK(toks[3].token.loc.col == 10);  // 1
  CHECK(toks[5].token.value == "return");
  CHECK(toks[5].token.loc.line == 1);
  CHECK(toks[5].token.loc.col == 2);
  CHECK(toks[5].token.loc.index == 15);
  CHECK(toks[8].token.value == "b");
  CHECK(toks[8].token.loc.line == 2);
  CHECK(toks[8].token.loc.col == 1);
}

TEST_CASE("operator characters the compiler rejects still lex")
{
  std::vector<LexToken> toks;
  REQUIRE(lex("a * b / c > d", &toks, nullptr) == CompileErr::OK);
  REQUIRE(toks.size() == 7);
  CHECK(toks[1].kind == TokenKind::Syntax);
  CHECK(toks[1].token.value == "*");
  CHECK(toks[3].token.value == "/");
  CHECK(toks[5].token.value == ">");
}

TEST_CASE("unexpected character")
{
  std::vector<LexToken> toks;
  CompileDiag diag;
  CHECK(lex("local a = 1;\nreturn a # 2;", &toks, &diag) == CompileErr::UnexpectedChar);
  CHECK(diag.code == CompileErr::UnexpectedChar);
  CHECK(diag.loc.line == 1);
  CHECK(diag.loc.col == 9);
  CHECK(diag.message.find("'#'") != std::string::npos);
  CHECK(toks.empty());
}

TEST_CASE("empty and whitespace-only input")
{
  std::vector<LexToken> toks;
  CHECK(lex("", &toks, nullptr) == CompileErr::OK);
  CHECK(toks.empty());
  CHECK(lex(" \n\t\r\n", &toks, nullptr) == CompileErr::OK);
  CHECK(toks.empty());
}

TEST_CASE("token kind names")
{
  CHECK(std::string(token_kind_str(TokenKind::Keyword)) == "keyword");
  CHECK(std::string(token_kind_str(TokenKind::Number)) == "number");
}
