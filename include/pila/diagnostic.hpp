#pragma once
#include <string>

#include "pila/ast.hpp"
#include "pila/compile_errors.hpp"

namespace pila
{

/**
 * @brief First error reported by the lexer, parser or compiler.
 */
struct CompileDiag
{
  CompileErr code = CompileErr::OK;
  Location loc;
  std::string message;  ///< compile_err_str(code) plus the offending text
};

/**
 * @brief Render a message with the offending source line and a caret.
 *
 * Output shape:
 *   <msg>
 *
 *   <source line loc.line>
 *   <loc.col spaces>^ Near here
 */
std::string format_diagnostic(const std::string& source, const Location& loc,
                              const std::string& msg);

/** Fill `diag` (if non-null) and return `code`. */
CompileErr report(CompileDiag* diag, CompileErr code, const Location& loc,
                  const std::string& detail);

}  // namespace pila
