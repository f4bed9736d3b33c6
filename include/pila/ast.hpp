#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pila
{

/**
 * @brief Position of a token in the source text (0-based).
 */
struct Location
{
  int32_t line = 0;
  int32_t col = 0;
  size_t index = 0;
};

/**
 * @brief Source text plus position, carried by identifiers, numbers and
 * operators for diagnostics.
 */
struct Token
{
  std::string value;
  Location loc;
};

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------
enum class ExprKind : uint8_t
{
  Number,      // token = digits
  Identifier,  // token = name
  Binary,      // token = operator, operands = {left, right}
  Call,        // token = callee name, operands = arguments
};

struct Expression
{
  ExprKind kind = ExprKind::Number;
  Token token;
  std::vector<Expression> operands;
};

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------
enum class StmtKind : uint8_t
{
  Function,    // name, params, body
  If,          // expr = test, body
  Local,       // name, expr = initializer
  Return,      // expr
  Expression,  // expr
};

struct Statement
{
  StmtKind kind = StmtKind::Expression;
  Token name;                   // Function / Local
  std::vector<Token> params;    // Function
  Expression expr;              // If test, Local initializer, Return, Expression
  std::vector<Statement> body;  // Function / If
  Location loc;                 // Position of the leading keyword or expression
};

/** A whole program: statements executed top to bottom. */
using Ast = std::vector<Statement>;

// ---------------------------------------------------------------------------
// Builders (used by the parser and by tests that skip the front end)
// ---------------------------------------------------------------------------
Expression make_number(const std::string& digits, Location loc = {});
Expression make_identifier(const std::string& name, Location loc = {});
Expression make_binary(const std::string& op, Expression left, Expression right,
                       Location loc = {});
Expression make_call(const std::string& name, std::vector<Expression> args,
                     Location loc = {});

Statement make_function(const std::string& name, const std::vector<std::string>& params,
                        std::vector<Statement> body, Location loc = {});
Statement make_if(Expression test, std::vector<Statement> body, Location loc = {});
Statement make_local(const std::string& name, Expression init, Location loc = {});
Statement make_return(Expression value, Location loc = {});
Statement make_expression(Expression value);

}  // namespace pila
