#ifndef DLSCRIPT_REPL_REPL_H_
#define DLSCRIPT_REPL_REPL_H_

#include <iostream>
#include <memory>
#include <string>

#include "builtin/builtins.h"
#include "runtime/environment.h"

namespace dlscript::repl {

class Repl {
 public:
  /// Creates a session with an empty global environment; print goes to std::cout.
  Repl();
  ~Repl();

  /// Starts the interactive loop until EOF or "exit".
  void Run();

 private:
  /// Processes one line; returns true when the loop should terminate.
  bool ProcessLine(const std::string& line);
  /// Parses and runs the buffered source. Incomplete source stays buffered unless `force`.
  void TryEvaluate(bool force);

  std::shared_ptr<runtime::Environment> env_;
  builtin::HostDispatcher dispatcher_;
  std::string pending_;
};

}  // namespace dlscript::repl

#endif  // DLSCRIPT_REPL_REPL_H_
