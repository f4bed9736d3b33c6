#pragma once

/* Compile-time error handling (lexer, parser, code generator)
 *
 * Same X-macro pattern as errors.hpp, kept in a separate table so run-time
 * and compile-time codes never collide.
 */

#define PILA_COMPILE_ERR(name, val, msg) name = val,

namespace pila
{

enum class CompileErr : int
{
#include "pila/compile_errors.def"
};

#undef PILA_COMPILE_ERR

// Helper to get a string message for each error
inline const char* compile_err_str(CompileErr e)
{
  switch (e)
  {
#define PILA_COMPILE_ERR(name, val, msg) \
  case CompileErr::name:                 \
    return msg;
#include "pila/compile_errors.def"
#undef PILA_COMPILE_ERR
    default:
      return "unknown error";
  }
}

inline int compile_err_to_int(CompileErr e)
{
  return static_cast<int>(e);
}

inline bool is_ok(CompileErr e)
{
  return e == CompileErr::OK;
}

inline bool is_error(CompileErr e)
{
  return e != CompileErr::OK;
}

}  // namespace pila
