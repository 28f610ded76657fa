#ifndef DLSCRIPT_RUNTIME_RUNTIME_ERROR_H_
#define DLSCRIPT_RUNTIME_RUNTIME_ERROR_H_

#include <optional>
#include <string>

#include "util/error.h"
#include "util/status.h"

namespace dlscript::runtime {

enum class RuntimeErrorKind {
  kUndefinedVariable,
  kUndefinedFunction,
  kArity,
  kDivisionByZero,
  kDomain,
  kShape,
  kTypeMismatch,
  kDispatchFailure,
};

const char* RuntimeErrorKindName(RuntimeErrorKind kind);

/// Evaluation failure. Carries the location of the node that failed.
class RuntimeError : public util::Error {
 public:
  RuntimeError(RuntimeErrorKind kind, const std::string& message, int line, int column)
      : util::Error(message, line, column), kind_(kind) {}

  /// Wraps a failed dispatch; the original status stays available to the caller.
  RuntimeError(const util::Status& dispatch_status, const std::string& message, int line,
               int column)
      : util::Error(message, line, column),
        kind_(RuntimeErrorKind::kDispatchFailure),
        dispatch_status_(dispatch_status) {}

  RuntimeErrorKind kind() const { return kind_; }
  const std::optional<util::Status>& dispatch_status() const { return dispatch_status_; }

 private:
  RuntimeErrorKind kind_;
  std::optional<util::Status> dispatch_status_;
};

inline const char* RuntimeErrorKindName(RuntimeErrorKind kind) {
  switch (kind) {
    case RuntimeErrorKind::kUndefinedVariable:
      return "undefined_variable";
    case RuntimeErrorKind::kUndefinedFunction:
      return "undefined_function";
    case RuntimeErrorKind::kArity:
      return "arity";
    case RuntimeErrorKind::kDivisionByZero:
      return "division_by_zero";
    case RuntimeErrorKind::kDomain:
      return "domain";
    case RuntimeErrorKind::kShape:
      return "shape";
    case RuntimeErrorKind::kTypeMismatch:
      return "type_mismatch";
    case RuntimeErrorKind::kDispatchFailure:
      return "dispatch_failure";
  }
  return "unknown";
}

}  // namespace dlscript::runtime

#endif  // DLSCRIPT_RUNTIME_RUNTIME_ERROR_H_
