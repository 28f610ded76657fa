// Entry point for the dlscript REPL or script runner.
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "builtin/builtins.h"
#include "repl/repl.h"
#include "runtime/environment.h"
#include "runtime/runner.h"
#include "runtime/runtime_error.h"
#include "util/error.h"
#include "util/log.h"

namespace {

void LogFatal(const std::string& message, int line, int column) {
  dlscript::util::LogRecord record;
  record.level = dlscript::util::LogLevel::kError;
  record.component = "cli";
  record.line = line;
  record.column = column;
  record.message = message;
  dlscript::util::Log(record);
}

int RunFile(const char* path) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "Could not open file: " << path << "\n";
    return 1;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  auto env = std::make_shared<dlscript::runtime::Environment>();
  dlscript::builtin::HostDispatcher dispatcher(std::cout);
  int status = 0;
  try {
    // Script mode only prints via explicit print().
    dlscript::runtime::RunSource(buffer.str(), env, &dispatcher);
  } catch (const dlscript::runtime::RuntimeError& err) {
    LogFatal(std::string(dlscript::runtime::RuntimeErrorKindName(err.kind())) + ": " + err.what(),
             err.line(), err.column());
    std::cerr << err.formatted() << "\n";
    status = 1;
  } catch (const dlscript::util::Error& err) {
    LogFatal(err.what(), err.line(), err.column());
    std::cerr << err.formatted() << "\n";
    status = 1;
  } catch (const std::exception& ex) {
    LogFatal(ex.what(), 0, 0);
    std::cerr << "Unhandled error: " << ex.what() << "\n";
    status = 1;
  }
  env->Clear();
  return status;
}

}  // namespace

int main(int argc, char** argv) {
  // Simple CLI: no args -> REPL; arg[1] -> run script file.
  if (argc > 1) {
    return RunFile(argv[1]);
  }
  dlscript::repl::Repl repl;
  repl.Run();
  return 0;
}
