#include "pila/parser.hpp"

#include <utility>

namespace pila
{

namespace
{

struct Parser
{
  const std::vector<LexToken>& tokens;
  size_t pos;
  CompileDiag* diag;
};

}  // namespace

// ---------------------------------------------------------------------------
// Token helpers
// ---------------------------------------------------------------------------

static bool at_end(const Parser& p)
{
  return p.pos >= p.tokens.size();
}

static bool expect_keyword(const Parser& p, const char* value)
{
  return !at_end(p) && p.tokens[p.pos].kind == TokenKind::Keyword &&
         p.tokens[p.pos].token.value == value;
}

static bool expect_syntax(const Parser& p, const char* value)
{
  return !at_end(p) && p.tokens[p.pos].kind == TokenKind::Syntax &&
         p.tokens[p.pos].token.value == value;
}

static bool expect_kind(const Parser& p, TokenKind kind)
{
  return !at_end(p) && p.tokens[p.pos].kind == kind;
}

// Operator tokens: any syntax that does not delimit statements or calls
static bool expect_operator(const Parser& p)
{
  if (!expect_kind(p, TokenKind::Syntax))
    return false;
  const std::string& v = p.tokens[p.pos].token.value;
  return v != ";" && v != "=" && v != "(" && v != ")" && v != ",";
}

// Report a parse error at the current token (or the last one at end of input)
static CompileErr fail(const Parser& p, const std::string& expected)
{
  if (at_end(p))
  {
    Location loc = p.tokens.empty() ? Location{} : p.tokens.back().token.loc;
    return report(p.diag, CompileErr::UnexpectedEnd, loc, expected);
  }
  const Token& t = p.tokens[p.pos].token;
  return report(p.diag, CompileErr::UnexpectedToken, t.loc,
                expected + ", found '" + t.value + "'");
}

static CompileErr parse_statement(Parser& p, Statement* out);
static CompileErr parse_expression(Parser& p, Expression* out);

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

// NAME ( [EXPR {, EXPR}] )   -- the name has already been consumed
static CompileErr parse_call_arguments(Parser& p, Expression* call)
{
  p.pos++;  // Skip past open paren

  while (!expect_syntax(p, ")"))
  {
    if (!call->operands.empty())
    {
      if (!expect_syntax(p, ","))
        return fail(p, "expected ',' between function call arguments");
      p.pos++;  // Skip past comma
    }

    Expression arg;
    CompileErr err = parse_expression(p, &arg);
    if (err != CompileErr::OK)
      return err;
    call->operands.push_back(std::move(arg));
  }

  p.pos++;  // Skip past closing paren
  return CompileErr::OK;
}

// NUMBER | NAME | NAME ( args ) | ( EXPR )
static CompileErr parse_operand(Parser& p, Expression* out)
{
  if (expect_kind(p, TokenKind::Number))
  {
    *out = make_number(p.tokens[p.pos].token.value, p.tokens[p.pos].token.loc);
    p.pos++;
    return CompileErr::OK;
  }

  if (expect_kind(p, TokenKind::Identifier))
  {
    const Token& name = p.tokens[p.pos].token;
    p.pos++;
    if (expect_syntax(p, "("))
    {
      *out = make_call(name.value, {}, name.loc);
      return parse_call_arguments(p, out);
    }
    *out = make_identifier(name.value, name.loc);
    return CompileErr::OK;
  }

  if (expect_syntax(p, "("))
  {
    p.pos++;  // Skip past open paren
    CompileErr err = parse_expression(p, out);
    if (err != CompileErr::OK)
      return err;
    if (!expect_syntax(p, ")"))
      return fail(p, "expected ')' to close grouped expression");
    p.pos++;
    return CompileErr::OK;
  }

  return fail(p, "expected number, identifier or '('");
}

// OPERAND {OP OPERAND}, left-associative
static CompileErr parse_expression(Parser& p, Expression* out)
{
  CompileErr err = parse_operand(p, out);
  if (err != CompileErr::OK)
    return err;

  while (expect_operator(p))
  {
    const Token op = p.tokens[p.pos].token;
    p.pos++;  // Skip past op

    Expression right;
    if ((err = parse_operand(p, &right)) != CompileErr::OK)
      return err;

    Expression left = std::move(*out);
    *out = make_binary(op.value, std::move(left), std::move(right), op.loc);
  }
  return CompileErr::OK;
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

// Statements up to (and including) the closing `end`
static CompileErr parse_block(Parser& p, std::vector<Statement>* body, const char* context)
{
  while (!expect_keyword(p, "end"))
  {
    if (at_end(p))
      return fail(p, std::string("expected 'end' to close ") + context);

    Statement stmt;
    CompileErr err = parse_statement(p, &stmt);
    if (err != CompileErr::OK)
      return err;
    body->push_back(std::move(stmt));
  }

  p.pos++;  // Skip past end
  return CompileErr::OK;
}

static CompileErr parse_function(Parser& p, Statement* out)
{
  out->kind = StmtKind::Function;
  out->loc = p.tokens[p.pos].token.loc;
  p.pos++;  // Skip past function

  if (!expect_kind(p, TokenKind::Identifier))
    return fail(p, "expected valid identifier for function name");
  out->name = p.tokens[p.pos].token;
  p.pos++;  // Skip past name

  if (!expect_syntax(p, "("))
    return fail(p, "expected open parenthesis in function declaration");
  p.pos++;  // Skip past open paren

  while (!expect_syntax(p, ")"))
  {
    if (!out->params.empty())
    {
      if (!expect_syntax(p, ","))
        return fail(p, "expected comma or close parenthesis after parameter");
      p.pos++;  // Skip past comma
    }

    if (!expect_kind(p, TokenKind::Identifier))
      return fail(p, "expected parameter name");
    out->params.push_back(p.tokens[p.pos].token);
    p.pos++;
  }
  p.pos++;  // Skip past close paren

  return parse_block(p, &out->body, "function declaration");
}

static CompileErr parse_if(Parser& p, Statement* out)
{
  out->kind = StmtKind::If;
  out->loc = p.tokens[p.pos].token.loc;
  p.pos++;  // Skip past if

  CompileErr err = parse_expression(p, &out->expr);
  if (err != CompileErr::OK)
    return err;

  if (!expect_keyword(p, "then"))
    return fail(p, "expected 'then' after if test");
  p.pos++;  // Skip past then

  return parse_block(p, &out->body, "if body");
}

static CompileErr parse_local(Parser& p, Statement* out)
{
  out->kind = StmtKind::Local;
  out->loc = p.tokens[p.pos].token.loc;
  p.pos++;  // Skip past local

  if (!expect_kind(p, TokenKind::Identifier))
    return fail(p, "expected valid identifier for local name");
  out->name = p.tokens[p.pos].token;
  p.pos++;  // Skip past name

  if (!expect_syntax(p, "="))
    return fail(p, "expected '=' in local declaration");
  p.pos++;  // Skip past =

  CompileErr err = parse_expression(p, &out->expr);
  if (err != CompileErr::OK)
    return err;

  if (!expect_syntax(p, ";"))
    return fail(p, "expected semicolon in local declaration");
  p.pos++;  // Skip past semicolon
  return CompileErr::OK;
}

static CompileErr parse_return(Parser& p, Statement* out)
{
  out->kind = StmtKind::Return;
  out->loc = p.tokens[p.pos].token.loc;
  p.pos++;  // Skip past return

  CompileErr err = parse_expression(p, &out->expr);
  if (err != CompileErr::OK)
    return err;

  if (!expect_syntax(p, ";"))
    return fail(p, "expected semicolon in return statement");
  p.pos++;  // Skip past semicolon
  return CompileErr::OK;
}

static CompileErr parse_expression_statement(Parser& p, Statement* out)
{
  out->kind = StmtKind::Expression;
  out->loc = p.tokens[p.pos].token.loc;

  CompileErr err = parse_expression(p, &out->expr);
  if (err != CompileErr::OK)
    return err;

  if (!expect_syntax(p, ";"))
    return fail(p, "expected semicolon after expression");
  p.pos++;  // Skip past semicolon
  return CompileErr::OK;
}

static CompileErr parse_statement(Parser& p, Statement* out)
{
  if (expect_keyword(p, "function"))
    return parse_function(p, out);
  if (expect_keyword(p, "if"))
    return parse_if(p, out);
  if (expect_keyword(p, "local"))
    return parse_local(p, out);
  if (expect_keyword(p, "return"))
    return parse_return(p, out);
  if (expect_kind(p, TokenKind::Keyword))
    return fail(p, "expected statement");
  return parse_expression_statement(p, out);
}

CompileErr parse(const std::vector<LexToken>& tokens, Ast* out, CompileDiag* diag)
{
  if (!out)
    return CompileErr::MalformedNode;
  out->clear();

  Parser p{tokens, 0, diag};
  while (!at_end(p))
  {
    Statement stmt;
    CompileErr err = parse_statement(p, &stmt);
    if (err != CompileErr::OK)
    {
      out->clear();
      return err;
    }
    out->push_back(std::move(stmt));
  }
  return CompileErr::OK;
}

}  // namespace pila
