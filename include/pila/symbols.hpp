#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "pila/compile_errors.hpp"

namespace pila
{

/** Location value of a symbol that has been declared but not bound. */
constexpr uint32_t kUnbound = UINT32_MAX;

/** Maximum number of labels (and, separately, functions) per program. */
constexpr size_t kMaxSymbols = UINT16_MAX;

/**
 * @brief Resolved bytecode address plus calling metadata.
 *
 * Synthetic labels always carry arity = local_count = 0.
 */
struct Symbol
{
  uint32_t location = kUnbound;  ///< Byte offset into Program::code
  uint16_t arity = 0;            ///< Parameter count
  uint16_t local_count = 0;      ///< Parameters + declared locals
};

/** Opaque handle to a compiler-generated jump target. */
struct Label
{
  uint16_t id = 0;
};

/** Opaque handle to a user function. */
struct FunctionId
{
  uint16_t id = 0;
};

/**
 * @brief Function and label table of one program.
 *
 * User function names and synthetic labels live in separate tables with
 * separate handle types; they meet only in lookup(), which resolves a name
 * against both.
 */
class SymbolTable
{
 public:
  // -------------------------------------------------------------------------
  // Labels
  // -------------------------------------------------------------------------

  /**
   * @brief Create an unbound label named `<prefix>_<hint>`.
   * @return TooManySymbols if the label table is full.
   */
  CompileErr new_label(const char* prefix, uint32_t hint, Label* out);

  /** Bind a label to a byte offset. */
  void bind_label(Label label, uint32_t location);

  /** Resolve a label id; nullptr if out of range. */
  const Symbol* label(uint16_t id) const;

  const std::string& label_name(uint16_t id) const;

  size_t label_count() const { return labels_.size(); }

  // -------------------------------------------------------------------------
  // Functions
  // -------------------------------------------------------------------------

  /**
   * @brief Declare a function with its arity, location unbound.
   * @return DuplicateFunction if the name is taken, TooManySymbols if full.
   */
  CompileErr declare_function(const std::string& name, uint16_t arity, FunctionId* out);

  /** Bind a declared function to the byte offset of its first body byte. */
  void bind_function(FunctionId fn, uint32_t location);

  /** Finalize the slot count once the whole body has been compiled. */
  void set_local_count(FunctionId fn, uint16_t local_count);

  /** Find a declared function by name. */
  bool find_function(const std::string& name, FunctionId* out) const;

  /** Resolve a function id; nullptr if out of range. */
  const Symbol* function(uint16_t id) const;

  const std::string& function_name(uint16_t id) const;

  size_t function_count() const { return functions_.size(); }

  // -------------------------------------------------------------------------
  // Resolution
  // -------------------------------------------------------------------------

  /**
   * @brief Look up any name, functions first, then labels.
   * @return true and fills `out` if found.
   */
  bool lookup(const std::string& name, Symbol* out) const;

  /**
   * @brief Check that every label and function is bound.
   * @param unbound_name  Receives the first unbound name (can be nullptr).
   * @return UnboundSymbol on the first unbound entry, OK otherwise.
   */
  CompileErr verify(std::string* unbound_name) const;

  void clear();

 private:
  struct Entry
  {
    std::string name;
    Symbol symbol;
  };

  std::vector<Entry> labels_;
  std::vector<Entry> functions_;
  std::map<std::string, uint16_t> function_index_;
};

}  // namespace pila
