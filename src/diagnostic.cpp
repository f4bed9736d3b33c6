#include "pila/diagnostic.hpp"

namespace pila
{

std::string format_diagnostic(const std::string& source, const Location& loc,
                              const std::string& msg)
{
  // Find the whole offending line
  std::string line_str;
  int32_t line = 0;
  for (char c : source)
  {
    if (c == '\n')
    {
      if (line == loc.line)
        break;
      ++line;
      continue;
    }
    if (line == loc.line && c != '\r')
      line_str.push_back(c);
  }

  std::string out = msg;
  out += "\n\n";
  out += line_str;
  out += "\n";
  out.append(loc.col > 0 ? static_cast<size_t>(loc.col) : 0, ' ');
  out += "^ Near here";
  return out;
}

CompileErr report(CompileDiag* diag, CompileErr code, const Location& loc,
                  const std::string& detail)
{
  if (diag)
  {
    diag->code = code;
    diag->loc = loc;
    diag->message = compile_err_str(code);
    if (!detail.empty())
    {
      diag->message += " ";
      diag->message += detail;
    }
  }
  return code;
}

}  // namespace pila
