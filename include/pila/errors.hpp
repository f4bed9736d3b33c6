#pragma once

// Run-time error codes, generated from errors.def.
// Define ERR(name, val, msg) before including errors.def to extract text or
// mapping.

#ifndef ERR
#define ERR(name, val, msg) name = val,
#endif

enum class Err : int
{
#include "pila/errors.def"
};

#undef ERR

// Macro to reduce noise at error returns
#define PILA_ERR(name) static_cast<pila_err>(Err::name)

// Human-readable message for each error
inline const char *err_str(Err e)
{
  switch (e)
  {
#define ERR(name, val, msg) \
  case Err::name:           \
    return msg;
#include "pila/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

// Symbolic name for each error (e.g. "StackUnderflow")
inline const char *err_name(Err e)
{
  switch (e)
  {
#define ERR(name, val, msg) \
  case Err::name:           \
    return #name;
#include "pila/errors.def"
#undef ERR
    default:
      return "Unknown";
  }
}
