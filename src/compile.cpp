#include "pila/compile.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <string>

#include "pila/builtins.hpp"
#include "pila/opcodes.hpp"

using namespace pila;

// ---------------------------------------------------------------------------
// Bytecode buffer helpers
// ---------------------------------------------------------------------------

static void append_byte(std::vector<uint8_t>& code, uint8_t byte)
{
  code.push_back(byte);
}

// Append a 16-bit value in little-endian format
static void append_u16_le(std::vector<uint8_t>& code, uint16_t val)
{
  append_byte(code, (uint8_t)(val & 0xFF));
  append_byte(code, (uint8_t)((val >> 8) & 0xFF));
}

// Append a 32-bit value in little-endian format
static void append_i32_le(std::vector<uint8_t>& code, int32_t val)
{
  uint32_t u = (uint32_t)val;
  append_byte(code, (uint8_t)(u & 0xFF));
  append_byte(code, (uint8_t)((u >> 8) & 0xFF));
  append_byte(code, (uint8_t)((u >> 16) & 0xFF));
  append_byte(code, (uint8_t)((u >> 24) & 0xFF));
}

static void append_op(std::vector<uint8_t>& code, Op op)
{
  append_byte(code, static_cast<uint8_t>(op));
}

// Try parsing a decimal literal into the 32-bit value range
static bool try_parse_int(const std::string& text, int32_t* out, bool* overflow)
{
  *overflow = false;
  if (text.empty())
    return false;
  for (char c : text)
  {
    if (c < '0' || c > '9')
      return false;
  }

  errno = 0;
  char* endptr = nullptr;
  long long val = strtoll(text.c_str(), &endptr, 10);
  if (errno == ERANGE || val > INT32_MAX)
  {
    *overflow = true;
    return false;
  }
  *out = (int32_t)val;
  return true;
}

static std::string quoted(const std::string& s)
{
  return "'" + s + "'";
}

// ---------------------------------------------------------------------------
// Compile state
// ---------------------------------------------------------------------------

// Largest slot index addressable by LGET's signed 16-bit offset
#define MAX_SLOTS 0x7FFF
// CALL / SYS carry the argument count in one byte
#define MAX_ARGS 0xFF

namespace
{

// Local-name table of one function body (or of the top level)
struct Scope
{
  std::map<std::string, uint16_t> slots;
  uint32_t next_slot = 0;
};

struct Compiler
{
  Program* pgm;
  CompileDiag* diag;
};

}  // namespace

static CompileErr compile_statement(Compiler& c, Scope& scope, const Statement& stmt);
static CompileErr compile_expression(Compiler& c, const Scope& scope, const Expression& expr);

// ---------------------------------------------------------------------------
// Declare pass: register every function and its arity
// ---------------------------------------------------------------------------

static CompileErr declare_functions(Compiler& c, const std::vector<Statement>& stmts)
{
  for (const Statement& stmt : stmts)
  {
    if (stmt.kind == StmtKind::Function)
    {
      if (stmt.name.value.empty())
        return report(c.diag, CompileErr::MalformedNode, stmt.loc, "function without a name");
      if (stmt.params.size() > MAX_ARGS)
        return report(c.diag, CompileErr::TooManySlots, stmt.name.loc,
                      "too many parameters for " + quoted(stmt.name.value));

      FunctionId fn;
      CompileErr err = c.pgm->symbols.declare_function(
          stmt.name.value, static_cast<uint16_t>(stmt.params.size()), &fn);
      if (err != CompileErr::OK)
        return report(c.diag, err, stmt.name.loc, quoted(stmt.name.value));
    }

    if (stmt.kind == StmtKind::Function || stmt.kind == StmtKind::If)
    {
      CompileErr err = declare_functions(c, stmt.body);
      if (err != CompileErr::OK)
        return err;
    }
  }
  return CompileErr::OK;
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

static CompileErr compile_number(Compiler& c, const Expression& expr)
{
  int32_t value = 0;
  bool overflow = false;
  if (!try_parse_int(expr.token.value, &value, &overflow))
  {
    if (overflow)
      return report(c.diag, CompileErr::NumberOutOfRange, expr.token.loc,
                    quoted(expr.token.value));
    return report(c.diag, CompileErr::MalformedNode, expr.token.loc,
                  "invalid number " + quoted(expr.token.value));
  }

  append_op(c.pgm->code, Op::LIT);
  append_i32_le(c.pgm->code, value);
  return CompileErr::OK;
}

static CompileErr compile_identifier(Compiler& c, const Scope& scope, const Expression& expr)
{
  auto it = scope.slots.find(expr.token.value);
  if (it == scope.slots.end())
    return report(c.diag, CompileErr::UndefinedIdentifier, expr.token.loc,
                  quoted(expr.token.value));

  append_op(c.pgm->code, Op::LGET);
  append_u16_le(c.pgm->code, it->second);
  return CompileErr::OK;
}

static CompileErr compile_binary_operation(Compiler& c, const Scope& scope,
                                           const Expression& expr)
{
  if (expr.operands.size() != 2)
    return report(c.diag, CompileErr::MalformedNode, expr.token.loc,
                  "binary operation needs two operands");

  CompileErr err;
  if ((err = compile_expression(c, scope, expr.operands[0])) != CompileErr::OK)
    return err;
  if ((err = compile_expression(c, scope, expr.operands[1])) != CompileErr::OK)
    return err;

  const std::string& op = expr.token.value;
  if (op == "+")
    append_op(c.pgm->code, Op::ADD);
  else if (op == "-")
    append_op(c.pgm->code, Op::SUB);
  else if (op == "<")
    append_op(c.pgm->code, Op::LT);
  else
    return report(c.diag, CompileErr::UnknownOperator, expr.token.loc, quoted(op));
  return CompileErr::OK;
}

static CompileErr compile_function_call(Compiler& c, const Scope& scope,
                                        const Expression& expr)
{
  const std::string& name = expr.token.value;
  if (expr.operands.size() > MAX_ARGS)
    return report(c.diag, CompileErr::MalformedNode, expr.token.loc,
                  "too many arguments in call to " + quoted(name));

  // Arguments are pushed left to right
  for (const Expression& arg : expr.operands)
  {
    CompileErr err = compile_expression(c, scope, arg);
    if (err != CompileErr::OK)
      return err;
  }
  uint8_t argc = static_cast<uint8_t>(expr.operands.size());

  // Builtins are intercepted before user functions
  uint8_t builtin_id;
  if (find_builtin(name.c_str(), &builtin_id))
  {
    append_op(c.pgm->code, Op::SYS);
    append_byte(c.pgm->code, builtin_id);
    append_byte(c.pgm->code, argc);
    return CompileErr::OK;
  }

  FunctionId fn;
  if (!c.pgm->symbols.find_function(name, &fn))
    return report(c.diag, CompileErr::UndefinedFunction, expr.token.loc, quoted(name));

  const Symbol* sym = c.pgm->symbols.function(fn.id);
  if (sym->arity != argc)
    return report(c.diag, CompileErr::ArityMismatch, expr.token.loc,
                  quoted(name) + " expects " + std::to_string(sym->arity) + ", got " +
                      std::to_string(argc));

  append_op(c.pgm->code, Op::CALL);
  append_u16_le(c.pgm->code, fn.id);
  append_byte(c.pgm->code, argc);
  return CompileErr::OK;
}

static CompileErr compile_expression(Compiler& c, const Scope& scope, const Expression& expr)
{
  switch (expr.kind)
  {
    case ExprKind::Number:
      return compile_number(c, expr);
    case ExprKind::Identifier:
      return compile_identifier(c, scope, expr);
    case ExprKind::Binary:
      return compile_binary_operation(c, scope, expr);
    case ExprKind::Call:
      return compile_function_call(c, scope, expr);
  }
  return report(c.diag, CompileErr::MalformedNode, expr.token.loc, "unknown expression kind");
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

static CompileErr compile_block(Compiler& c, Scope& scope, const std::vector<Statement>& body)
{
  for (const Statement& stmt : body)
  {
    CompileErr err = compile_statement(c, scope, stmt);
    if (err != CompileErr::OK)
      return err;
  }
  return CompileErr::OK;
}

static CompileErr compile_declaration(Compiler& c, const Statement& stmt)
{
  std::vector<uint8_t>& code = c.pgm->code;
  SymbolTable& syms = c.pgm->symbols;

  // Jump to end of function to guard top-level
  Label done;
  CompileErr err = syms.new_label("function_done", (uint32_t)code.size(), &done);
  if (err != CompileErr::OK)
    return report(c.diag, err, stmt.loc, quoted(stmt.name.value));
  append_op(code, Op::JMP);
  append_u16_le(code, done.id);

  FunctionId fn;
  if (!syms.find_function(stmt.name.value, &fn))
    return report(c.diag, CompileErr::MalformedNode, stmt.name.loc,
                  "function " + quoted(stmt.name.value) + " was not declared");
  syms.bind_function(fn, (uint32_t)code.size());

  // Arguments sit below the frame base: parameter i of k at fp - (k - i)
  Scope scope;
  const size_t k = stmt.params.size();
  for (size_t i = 0; i < k; ++i)
  {
    const Token& param = stmt.params[i];
    if (scope.slots.count(param.value))
      return report(c.diag, CompileErr::MalformedNode, param.loc,
                    "duplicate parameter " + quoted(param.value));

    append_op(code, Op::BIND);
    append_u16_le(code, (uint16_t)i);
    append_u16_le(code, (uint16_t)(int16_t)(-(int32_t)(k - i)));
    scope.slots[param.value] = (uint16_t)i;
  }
  scope.next_slot = (uint32_t)k;

  if ((err = compile_block(c, scope, stmt.body)) != CompileErr::OK)
    return err;

  // Falling off the end returns 0
  append_op(code, Op::LIT);
  append_i32_le(code, 0);
  append_op(code, Op::RET);

  syms.set_local_count(fn, (uint16_t)scope.next_slot);
  syms.bind_label(done, (uint32_t)code.size());
  return CompileErr::OK;
}

static CompileErr compile_if(Compiler& c, Scope& scope, const Statement& stmt)
{
  CompileErr err = compile_expression(c, scope, stmt.expr);
  if (err != CompileErr::OK)
    return err;

  Label done;
  if ((err = c.pgm->symbols.new_label("if_else", (uint32_t)c.pgm->code.size(), &done)) !=
      CompileErr::OK)
    return report(c.diag, err, stmt.loc, "");
  append_op(c.pgm->code, Op::JZ);
  append_u16_le(c.pgm->code, done.id);

  if ((err = compile_block(c, scope, stmt.body)) != CompileErr::OK)
    return err;

  c.pgm->symbols.bind_label(done, (uint32_t)c.pgm->code.size());
  return CompileErr::OK;
}

static CompileErr compile_local(Compiler& c, Scope& scope, const Statement& stmt)
{
  if (stmt.name.value.empty())
    return report(c.diag, CompileErr::MalformedNode, stmt.loc, "local without a name");
  if (scope.next_slot > MAX_SLOTS)
    return report(c.diag, CompileErr::TooManySlots, stmt.name.loc, quoted(stmt.name.value));

  uint16_t slot = (uint16_t)scope.next_slot++;

  // The name becomes visible after its initializer
  CompileErr err = compile_expression(c, scope, stmt.expr);
  if (err != CompileErr::OK)
    return err;

  append_op(c.pgm->code, Op::LSET);
  append_u16_le(c.pgm->code, slot);
  scope.slots[stmt.name.value] = slot;
  return CompileErr::OK;
}

static CompileErr compile_return(Compiler& c, const Scope& scope, const Statement& stmt)
{
  CompileErr err = compile_expression(c, scope, stmt.expr);
  if (err != CompileErr::OK)
    return err;
  append_op(c.pgm->code, Op::RET);
  return CompileErr::OK;
}

static CompileErr compile_statement(Compiler& c, Scope& scope, const Statement& stmt)
{
  switch (stmt.kind)
  {
    case StmtKind::Function:
      return compile_declaration(c, stmt);
    case StmtKind::If:
      return compile_if(c, scope, stmt);
    case StmtKind::Local:
      return compile_local(c, scope, stmt);
    case StmtKind::Return:
      return compile_return(c, scope, stmt);
    case StmtKind::Expression:
    {
      CompileErr err = compile_expression(c, scope, stmt.expr);
      if (err != CompileErr::OK)
        return err;
      // Expression statements leave nothing behind
      append_op(c.pgm->code, Op::DROP);
      return CompileErr::OK;
    }
  }
  return report(c.diag, CompileErr::MalformedNode, stmt.loc, "unknown statement kind");
}

// ---------------------------------------------------------------------------
// Entry point
// ---------------------------------------------------------------------------

namespace pila
{

CompileErr compile(const Ast& ast, Program* out, CompileDiag* diag)
{
  if (!out)
    return CompileErr::MalformedNode;
  out->clear();

  Compiler c{out, diag};

  CompileErr err = declare_functions(c, ast);
  if (err == CompileErr::OK)
  {
    Scope top;
    err = compile_block(c, top, ast);
    out->top_local_count = top.next_slot;
  }

  if (err == CompileErr::OK)
  {
    std::string unbound;
    err = out->symbols.verify(&unbound);
    if (err != CompileErr::OK)
      report(diag, err, Location{}, quoted(unbound));
  }

  // No partial output
  if (err != CompileErr::OK)
    out->clear();
  return err;
}

}  // namespace pila
