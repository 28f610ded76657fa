#ifndef DLSCRIPT_BUILTIN_DISPATCH_H_
#define DLSCRIPT_BUILTIN_DISPATCH_H_

#include <string>
#include <unordered_map>
#include <vector>

#include "builtin/keywords.h"
#include "runtime/value.h"
#include "util/status.h"

namespace dlscript::builtin {

/// Boundary between the evaluator and the ML/IO/Plot collaborators. The evaluator hands over
/// the keyword and the already-evaluated arguments and passes the result through unchanged.
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  /// Runs one built-in call. A non-ok status becomes RuntimeError{kDispatchFailure}.
  virtual util::StatusOr<runtime::Value> Dispatch(CallCategory category,
                                                  const std::string& keyword,
                                                  const std::vector<runtime::Value>& args) = 0;
};

/// One call observed by RecordingDispatcher.
struct DispatchedCall {
  CallCategory category;
  std::string keyword;
  std::vector<runtime::Value> args;
};

/// Dispatcher that records every call and answers with canned results. Unconfigured keywords
/// return none.
class RecordingDispatcher : public Dispatcher {
 public:
  util::StatusOr<runtime::Value> Dispatch(CallCategory category, const std::string& keyword,
                                          const std::vector<runtime::Value>& args) override;

  /// Makes every later call to `keyword` return `value`.
  void SetResult(const std::string& keyword, const runtime::Value& value);
  /// Makes every later call to `keyword` fail with `status`.
  void SetFailure(const std::string& keyword, const util::Status& status);

  const std::vector<DispatchedCall>& calls() const { return calls_; }
  /// Calls recorded for one keyword, in order.
  std::vector<DispatchedCall> CallsTo(const std::string& keyword) const;
  void Reset() { calls_.clear(); }

 private:
  std::vector<DispatchedCall> calls_;
  std::unordered_map<std::string, runtime::Value> results_;
  std::unordered_map<std::string, util::Status> failures_;
};

}  // namespace dlscript::builtin

#endif  // DLSCRIPT_BUILTIN_DISPATCH_H_
