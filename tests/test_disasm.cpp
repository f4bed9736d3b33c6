#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "pila/builtins.hpp"
#include "pila/disasm.hpp"
#include "pila/front.hpp"
#include "pila/opcodes.hpp"
#include "pila/program.hpp"

using namespace pila;

static Program build(const char* src)
{
  Program p;
  CompileDiag diag;
  REQUIRE(compile_source(src, &p, &diag) == CompileErr::OK);
  return p;
}

TEST_CASE("single instructions")
{
  Program p = build("local a = 5;\nprint(a, 0 - 1);\n");
  std::string line;

  CHECK(disasm_one(p, 0, line) == 5);
  CHECK(line == "0000: LIT 5");
  CHECK(disasm_one(p, 5, line) == 3);
  CHECK(line == "0005: LSET 0");
  CHECK(disasm_one(p, 8, line) == 3);
  CHECK(line == "0008: LGET fp+0");
  CHECK(disasm_one(p, 21, line) == 1);
  CHECK(line == "0021: SUB");
  CHECK(disasm_one(p, 22, line) == 3);
  CHECK(line == "0022: SYS print, 2");
  CHECK(disasm_one(p, 25, line) == 1);
  CHECK(line == "0025: DROP");

  // Past the end
  CHECK(disasm_one(p, p.code.size(), line) == 0);
}

TEST_CASE("functions, calls and labels")
{
  Program p = build(
      "function id(x) return x; end\n"
      "if 1 then id(2); end\n");
  std::string line;

  CHECK(disasm_one(p, 0, line) == 3);
  CHECK(line == "0000: JMP function_done_0 ; -> 0018");
  CHECK(disasm_one(p, 3, line) == 5);
  CHECK(line == "0003: BIND 0, fp-1");

  std::vector<std::string> all = disasm_all(p);
  REQUIRE(all.size() >= 4);
  CHECK(all[0] == "0000: JMP function_done_0 ; -> 0018");
  CHECK(all[1] == "id: ; arity=1 locals=1");
  CHECK(all[2] == "0003: BIND 0, fp-1");

  bool saw_call = false, saw_jz = false, saw_end_label = false;
  for (const std::string& l : all)
  {
    if (l.find("CALL id, 1") != std::string::npos)
      saw_call = true;
    if (l.find("JZ if_else_23") != std::string::npos)
      saw_jz = true;
    if (l == "if_else_23:")
      saw_end_label = true;
  }
  CHECK(saw_call);
  CHECK(saw_jz);
  CHECK(saw_end_label);

  // A label bound to the end of the code is listed last
  CHECK(all.back() == "if_else_23:");
}

TEST_CASE("raw bytes that do not decode")
{
  Program p;
  p.code = {0xEE, static_cast<uint8_t>(Op::LIT), 1, 2};
  std::string line;

  CHECK(disasm_one(p, 0, line) == 1);
  CHECK(line == "0000: .byte 0xEE");
  CHECK(disasm_one(p, 1, line) == 3);
  CHECK(line == "0001: LIT <truncated>");
}

TEST_CASE("unresolved references")
{
  Program p;
  p.code = {static_cast<uint8_t>(Op::JMP), 4, 0, static_cast<uint8_t>(Op::CALL), 9, 0, 1,
            static_cast<uint8_t>(Op::SYS), 0x33, 0};
  std::string line;

  disasm_one(p, 0, line);
  CHECK(line == "0000: JMP L4 ; -> ?");
  disasm_one(p, 3, line);
  CHECK(line == "0003: CALL #9, 1");
  disasm_one(p, 7, line);
  CHECK(line == "0007: SYS 0x33, 0");
}
