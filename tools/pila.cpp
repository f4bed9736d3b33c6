#include <cstdio>
#include <cstring>
#include <string>

#include "pila/diagnostic.hpp"
#include "pila/disasm.hpp"
#include "pila/errors.hpp"
#include "pila/front.hpp"
#include "pila/program.hpp"
#include "pila/vm_api.hpp"

namespace
{

enum ExitCode
{
  kExitOk = 0,
  kExitCompile = 1,
  kExitRuntime = 2,
};

void print_usage()
{
  fprintf(stderr, "Usage: pila <command> <file>\n");
  fprintf(stderr, "Commands:\n");
  fprintf(stderr, "  run <file>     Compile and run the program.\n");
  fprintf(stderr, "  disasm <file>  Compile and print the bytecode listing.\n");
}

bool read_file(const char* path, std::string* out)
{
  FILE* fp = fopen(path, "rb");
  if (!fp)
  {
    fprintf(stderr, "Error: could not open file %s\n", path);
    return false;
  }

  char buf[4096];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), fp)) > 0)
    out->append(buf, n);

  bool ok = !ferror(fp);
  fclose(fp);
  if (!ok)
    fprintf(stderr, "Error: could not read file %s\n", path);
  return ok;
}

bool build(const char* path, pila::Program* program)
{
  std::string source;
  if (!read_file(path, &source))
    return false;

  pila::CompileDiag diag;
  pila::CompileErr err = pila::compile_source(source, program, &diag);
  if (err != pila::CompileErr::OK)
  {
    std::string text = pila::format_diagnostic(source, diag.loc, diag.message);
    fprintf(stderr, "%s:%d:%d: error\n%s\n", path, (int)diag.loc.line + 1, (int)diag.loc.col + 1,
            text.c_str());
    return false;
  }
  return true;
}

int cmd_run(const pila::Program& program)
{
  Vm* vm = vm_create(nullptr);
  if (!vm)
  {
    fprintf(stderr, "Error: could not allocate VM\n");
    return kExitRuntime;
  }

  pila_err err = vm_exec(vm, &program);
  vm_destroy(vm);

  if (err != 0)
  {
    fprintf(stderr, "Error: %s\n", err_str(static_cast<Err>(err)));
    return kExitRuntime;
  }
  return kExitOk;
}

}  // namespace

int main(int argc, char** argv)
{
  if (argc != 3)
  {
    print_usage();
    return kExitCompile;
  }

  const char* command = argv[1];
  if (strcmp(command, "run") != 0 && strcmp(command, "disasm") != 0)
  {
    fprintf(stderr, "Error: unknown command '%s'\n", command);
    print_usage();
    return kExitCompile;
  }

  pila::Program program;
  if (!build(argv[2], &program))
    return kExitCompile;

  if (strcmp(command, "disasm") == 0)
  {
    pila::disasm_print(program, stdout);
    return kExitOk;
  }
  return cmd_run(program);
}
