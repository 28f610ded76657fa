#include "builtin/dispatch.h"

namespace dlscript::builtin {

util::StatusOr<runtime::Value> RecordingDispatcher::Dispatch(
    CallCategory category, const std::string& keyword, const std::vector<runtime::Value>& args) {
  calls_.push_back(DispatchedCall{category, keyword, args});
  auto failure = failures_.find(keyword);
  if (failure != failures_.end()) {
    return failure->second;
  }
  auto result = results_.find(keyword);
  if (result != results_.end()) {
    return result->second;
  }
  return runtime::Value::None();
}

void RecordingDispatcher::SetResult(const std::string& keyword, const runtime::Value& value) {
  failures_.erase(keyword);
  results_[keyword] = value;
}

void RecordingDispatcher::SetFailure(const std::string& keyword, const util::Status& status) {
  results_.erase(keyword);
  failures_[keyword] = status;
}

std::vector<DispatchedCall> RecordingDispatcher::CallsTo(const std::string& keyword) const {
  std::vector<DispatchedCall> out;
  for (const auto& call : calls_) {
    if (call.keyword == keyword) {
      out.push_back(call);
    }
  }
  return out;
}

}  // namespace dlscript::builtin
