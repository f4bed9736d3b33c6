#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "pila/ast.hpp"
#include "pila/builtins.hpp"
#include "pila/compile.hpp"
#include "pila/opcodes.hpp"
#include "pila/program.hpp"

using namespace pila;

static uint8_t op(Op o)
{
  return static_cast<uint8_t>(o);
}

static std::vector<Expression> args(Expression a)
{
  std::vector<Expression> v;
  v.push_back(std::move(a));
  return v;
}

static std::vector<Expression> args(Expression a, Expression b)
{
  std::vector<Expression> v;
  v.push_back(std::move(a));
  v.push_back(std::move(b));
  return v;
}

static std::vector<Statement> block(Statement s)
{
  std::vector<Statement> v;
  v.push_back(std::move(s));
  return v;
}

/* ------------------------------------------------------------------------- */
/* Code shape                                                                */
/* ------------------------------------------------------------------------- */

TEST_CASE("return of a binary expression")
{
  Ast ast;
  ast.push_back(make_return(make_binary("+", make_number("3"), make_number("4"))));

  Program p;
  REQUIRE(compile(ast, &p, nullptr) == CompileErr::OK);

  std::vector<uint8_t> expect = {op(Op::LIT), 3, 0, 0, 0, op(Op::LIT), 4, 0, 0, 0,
                                 op(Op::ADD), op(Op::RET)};
  CHECK(p.code == expect);
}

TEST_CASE("operators map to SUB and LT in source order")
{
  Ast ast;
  ast.push_back(make_expression(make_binary("-", make_number("10"), make_number("3"))));
  ast.push_back(make_expression(make_binary("<", make_number("1"), make_number("2"))));

  Program p;
  REQUIRE(compile(ast, &p, nullptr) == CompileErr::OK);

  std::vector<uint8_t> expect = {
      op(Op::LIT), 10, 0, 0, 0, op(Op::LIT), 3, 0, 0, 0, op(Op::SUB), op(Op::DROP),
      op(Op::LIT), 1,  0, 0, 0, op(Op::LIT), 2, 0, 0, 0, op(Op::LT),  op(Op::DROP)};
  CHECK(p.code == expect);
}

TEST_CASE("locals are numbered in declaration order")
{
  Ast ast;
  ast.push_back(make_local("a", make_number("1")));
  ast.push_back(make_local("b", make_identifier("a")));

  Program p;
  REQUIRE(compile(ast, &p, nullptr) == CompileErr::OK);

  std::vector<uint8_t> expect = {op(Op::LIT),  1, 0, 0, 0, op(Op::LSET), 0, 0,
                                 op(Op::LGET), 0, 0, op(Op::LSET), 1, 0};
  CHECK(p.code == expect);
}

TEST_CASE("function declaration layout")
{
  // function id(x) return x; end
  Ast ast;
  ast.push_back(make_function("id", {"x"}, block(make_return(make_identifier("x")))));

  Program p;
  REQUIRE(compile(ast, &p, nullptr) == CompileErr::OK);

  FunctionId fn;
  REQUIRE(p.symbols.find_function("id", &fn));
  const Symbol* sym = p.symbols.function(fn.id);
  CHECK(sym->arity == 1);
  CHECK(sym->local_count == 1);
  CHECK(sym->location == 3);

  REQUIRE(p.symbols.label_count() == 1);
  CHECK(p.symbols.label_name(0) == "function_done_0");
  CHECK(p.symbols.label(0)->location == p.code.size());

  std::vector<uint8_t> expect = {op(Op::JMP),  0,    0,           // skip body
                                 op(Op::BIND), 0,    0, 0xFF, 0xFF,  // slot 0 <- fp-1
                                 op(Op::LGET), 0,    0,           op(Op::RET),
                                 op(Op::LIT),  0,    0, 0,    0,    op(Op::RET)};
  CHECK(p.code == expect);
}

TEST_CASE("parameters bind from fp-k upward")
{
  // function f(a, b, c) end
  Ast ast;
  ast.push_back(make_function("f", {"a", "b", "c"}, {}));

  Program p;
  REQUIRE(compile(ast, &p, nullptr) == CompileErr::OK);

  // Three BINDs after the 3-byte JMP: offsets -3, -2, -1
  for (int i = 0; i < 3; ++i)
  {
    size_t at = 3 + (size_t)i * 5;
    CHECK(p.code[at] == op(Op::BIND));
    CHECK(p.code[at + 1] == i);
    int16_t off = (int16_t)(p.code[at + 3] | (p.code[at + 4] << 8));
    CHECK(off == i - 3);
  }
}

TEST_CASE("if compiles to JZ over the body")
{
  Ast ast;
  ast.push_back(make_if(make_number("0"), block(make_return(make_number("1")))));
  ast.push_back(make_return(make_number("2")));

  Program p;
  REQUIRE(compile(ast, &p, nullptr) == CompileErr::OK);

  CHECK(p.code[5] == op(Op::JZ));
  REQUIRE(p.symbols.label_count() == 1);
  // Label lands on the second return's LIT
  CHECK(p.symbols.label(0)->location == 5 + 3 + 5 + 1);
}

TEST_CASE("print compiles to SYS")
{
  Ast ast;
  ast.push_back(make_expression(make_call("print", args(make_number("1"), make_number("2")))));

  Program p;
  REQUIRE(compile(ast, &p, nullptr) == CompileErr::OK);

  std::vector<uint8_t> expect = {op(Op::LIT), 1, 0, 0, 0, op(Op::LIT), 2, 0, 0, 0,
                                 op(Op::SYS), PILA_BUILTIN_PRINT, 2, op(Op::DROP)};
  CHECK(p.code == expect);
}

TEST_CASE("calls may precede the function declaration")
{
  Ast ast;
  ast.push_back(make_return(make_call("later", args(make_number("2")))));
  ast.push_back(make_function("later", {"n"}, block(make_return(make_identifier("n")))));

  Program p;
  CHECK(compile(ast, &p, nullptr) == CompileErr::OK);
}

TEST_CASE("functions nested in bodies are declared globally")
{
  // function outer() function inner() return 1; end return inner(); end
  std::vector<Statement> outer_body;
  outer_body.push_back(make_function("inner", {}, block(make_return(make_number("1")))));
  outer_body.push_back(make_return(make_call("inner", {})));

  Ast ast;
  ast.push_back(make_function("outer", {}, std::move(outer_body)));
  ast.push_back(make_return(make_call("inner", {})));

  Program p;
  REQUIRE(compile(ast, &p, nullptr) == CompileErr::OK);
  CHECK(p.symbols.function_count() == 2);
}

TEST_CASE("local count covers parameters and body locals")
{
  std::vector<Statement> body;
  body.push_back(make_local("t", make_identifier("a")));
  body.push_back(make_if(make_number("1"), block(make_local("u", make_number("2")))));
  body.push_back(make_return(make_identifier("t")));

  Ast ast;
  ast.push_back(make_function("g", {"a"}, std::move(body)));

  Program p;
  REQUIRE(compile(ast, &p, nullptr) == CompileErr::OK);
  FunctionId fn;
  REQUIRE(p.symbols.find_function("g", &fn));
  CHECK(p.symbols.function(fn.id)->local_count == 3);
}

TEST_CASE("top-level locals are counted across if bodies")
{
  Ast ast;
  ast.push_back(make_local("a", make_number("1")));
  ast.push_back(make_if(make_number("0"), block(make_local("b", make_number("2")))));
  ast.push_back(make_return(make_identifier("b")));

  Program p;
  REQUIRE(compile(ast, &p, nullptr) == CompileErr::OK);
  CHECK(p.top_local_count == 2);

  p.clear();
  CHECK(p.top_local_count == 0);
}

/* ------------------------------------------------------------------------- */
/* Errors                                                                    */
/* ------------------------------------------------------------------------- */

TEST_CASE("unknown operator")
{
  Ast ast;
  ast.push_back(make_return(
      make_binary("*", make_number("2"), make_number("3"), Location{0, 9, 9})));

  Program p;
  CompileDiag diag;
  CHECK(compile(ast, &p, &diag) == CompileErr::UnknownOperator);
  CHECK(diag.code == CompileErr::UnknownOperator);
  CHECK(diag.loc.col == 9);
  CHECK(diag.message.find("'*'") != std::string::npos);
  CHECK(diag.message.find(compile_err_str(CompileErr::UnknownOperator)) == 0);
  CHECK(p.code.empty());
  CHECK(p.symbols.label_count() == 0);
}

TEST_CASE("undefined identifier")
{
  Ast ast;
  ast.push_back(make_return(make_identifier("ghost")));

  Program p;
  CompileDiag diag;
  CHECK(compile(ast, &p, &diag) == CompileErr::UndefinedIdentifier);
  CHECK(diag.message.find("'ghost'") != std::string::npos);
  CHECK(p.code.empty());
}

TEST_CASE("local is not visible in its own initializer")
{
  Ast ast;
  ast.push_back(make_local("x", make_identifier("x")));

  Program p;
  CHECK(compile(ast, &p, nullptr) == CompileErr::UndefinedIdentifier);
}

TEST_CASE("undefined function")
{
  Ast ast;
  ast.push_back(make_expression(make_call("nope", {})));

  Program p;
  CompileDiag diag;
  CHECK(compile(ast, &p, &diag) == CompileErr::UndefinedFunction);
  CHECK(p.code.empty());
}

TEST_CASE("call with the wrong number of arguments")
{
  Ast ast;
  ast.push_back(make_function("one", {"a"}, {}));
  ast.push_back(make_expression(make_call("one", args(make_number("1"), make_number("2")))));

  Program p;
  CompileDiag diag;
  CHECK(compile(ast, &p, &diag) == CompileErr::ArityMismatch);
  CHECK(diag.message.find("expects 1, got 2") != std::string::npos);
  CHECK(p.code.empty());
  CHECK(p.symbols.function_count() == 0);
}

TEST_CASE("duplicate function")
{
  Ast ast;
  ast.push_back(make_function("f", {}, {}));
  ast.push_back(make_function("f", {"x"}, {}));

  Program p;
  CHECK(compile(ast, &p, nullptr) == CompileErr::DuplicateFunction);
}

TEST_CASE("duplicate parameter")
{
  Ast ast;
  ast.push_back(make_function("f", {"x", "x"}, {}));

  Program p;
  CHECK(compile(ast, &p, nullptr) == CompileErr::MalformedNode);
}

TEST_CASE("number literals must fit in 32 bits")
{
  Program p;
  {
    Ast ast;
    ast.push_back(make_return(make_number("2147483647")));
    CHECK(compile(ast, &p, nullptr) == CompileErr::OK);
  }
  {
    Ast ast;
    ast.push_back(make_return(make_number("2147483648")));
    CHECK(compile(ast, &p, nullptr) == CompileErr::NumberOutOfRange);
  }
  {
    Ast ast;
    ast.push_back(make_return(make_number("12x")));
    CHECK(compile(ast, &p, nullptr) == CompileErr::MalformedNode);
  }
}

TEST_CASE("malformed nodes")
{
  Program p;
  {
    Expression bin = make_binary("+", make_number("1"), make_number("2"));
    bin.operands.pop_back();
    Ast ast;
    ast.push_back(make_return(std::move(bin)));
    CHECK(compile(ast, &p, nullptr) == CompileErr::MalformedNode);
  }
  {
    Ast ast;
    ast.push_back(make_function("", {}, {}));
    CHECK(compile(ast, &p, nullptr) == CompileErr::MalformedNode);
  }
  CHECK(compile(Ast{}, nullptr, nullptr) == CompileErr::MalformedNode);
}

TEST_CASE("an empty program compiles to no code")
{
  Program p;
  CHECK(compile(Ast{}, &p, nullptr) == CompileErr::OK);
  CHECK(p.code.empty());
}
