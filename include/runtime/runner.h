#ifndef DLSCRIPT_RUNTIME_RUNNER_H_
#define DLSCRIPT_RUNTIME_RUNNER_H_

#include <memory>
#include <optional>
#include <string>

#include "builtin/dispatch.h"
#include "runtime/environment.h"
#include "runtime/value.h"

namespace dlscript::runtime {

/// Lexes, parses and evaluates a whole program against `env`. Returns the value of the final
/// top-level statement when it is an assignment or expression statement. Lex, parse and
/// runtime errors propagate to the caller unchanged.
///
/// Functions defined at top level keep `env` alive through their closures, so the caller must
/// call `env->Clear()` once it is done with the environment.
std::optional<Value> RunSource(const std::string& source, std::shared_ptr<Environment> env,
                               builtin::Dispatcher* dispatcher);

}  // namespace dlscript::runtime

#endif  // DLSCRIPT_RUNTIME_RUNNER_H_
