#include "pila/front.hpp"

#include <vector>

#include "pila/lexer.hpp"
#include "pila/parser.hpp"

namespace pila
{

CompileErr compile_source(const std::string& source, Program* out, CompileDiag* diag)
{
  if (!out)
    return CompileErr::MalformedNode;
  out->clear();

  std::vector<LexToken> tokens;
  CompileErr err = lex(source, &tokens, diag);
  if (err != CompileErr::OK)
    return err;

  Ast ast;
  if ((err = parse(tokens, &ast, diag)) != CompileErr::OK)
    return err;

  return compile(ast, out, diag);
}

}  // namespace pila
