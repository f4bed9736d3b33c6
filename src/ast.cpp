#include "pila/ast.hpp"

#include <utility>

namespace pila
{

Expression make_number(const std::string& digits, Location loc)
{
  Expression e;
  e.kind = ExprKind::Number;
  e.token = Token{digits, loc};
  return e;
}

Expression make_identifier(const std::string& name, Location loc)
{
  Expression e;
  e.kind = ExprKind::Identifier;
  e.token = Token{name, loc};
  return e;
}

Expression make_binary(const std::string& op, Expression left, Expression right,
                       Location loc)
{
  Expression e;
  e.kind = ExprKind::Binary;
  e.token = Token{op, loc};
  e.operands.push_back(std::move(left));
  e.operands.push_back(std::move(right));
  return e;
}

Expression make_call(const std::string& name, std::vector<Expression> args, Location loc)
{
  Expression e;
  e.kind = ExprKind::Call;
  e.token = Token{name, loc};
  e.operands = std::move(args);
  return e;
}

Statement make_function(const std::string& name, const std::vector<std::string>& params,
                        std::vector<Statement> body, Location loc)
{
  Statement s;
  s.kind = StmtKind::Function;
  s.loc = loc;
  s.name = Token{name, loc};
  for (const std::string& p : params)
    s.params.push_back(Token{p, loc});
  s.body = std::move(body);
  return s;
}

Statement make_if(Expression test, std::vector<Statement> body, Location loc)
{
  Statement s;
  s.kind = StmtKind::If;
  s.loc = loc;
  s.expr = std::move(test);
  s.body = std::move(body);
  return s;
}

Statement make_local(const std::string& name, Expression init, Location loc)
{
  Statement s;
  s.kind = StmtKind::Local;
  s.loc = loc;
  s.name = Token{name, loc};
  s.expr = std::move(init);
  return s;
}

Statement make_return(Expression value, Location loc)
{
  Statement s;
  s.kind = StmtKind::Return;
  s.loc = loc;
  s.expr = std::move(value);
  return s;
}

Statement make_expression(Expression value)
{
  Statement s;
  s.kind = StmtKind::Expression;
  s.loc = value.token.loc;
  s.expr = std::move(value);
  return s;
}

}  // namespace pila
