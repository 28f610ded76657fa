#ifndef DLSCRIPT_UTIL_STATUS_H_
#define DLSCRIPT_UTIL_STATUS_H_

#include <string>
#include <type_traits>
#include <utility>

namespace dlscript::util {

enum class StatusCode { kOk, kInvalidArgument, kUnavailable, kInternal };

const char* StatusCodeName(StatusCode code);

struct Status {
  StatusCode code = StatusCode::kOk;
  std::string message;
  static Status OK() { return Status{StatusCode::kOk, ""}; }
  static Status Invalid(const std::string& msg) {
    return Status{StatusCode::kInvalidArgument, msg};
  }
  static Status Unavailable(const std::string& msg) {
    return Status{StatusCode::kUnavailable, msg};
  }
  static Status Internal(const std::string& msg) { return Status{StatusCode::kInternal, msg}; }
  bool ok() const { return code == StatusCode::kOk; }
  /// "<code>: <message>", or "ok".
  std::string ToString() const;
};

template <typename T>
class StatusOr {
 public:
  StatusOr(const Status& s) : status_(s) {}
  StatusOr(T v) : status_(Status::OK()), value_(std::move(v)) {}
  template <typename U, typename = std::enable_if_t<std::is_convertible<U, T>::value &&
                                                    !std::is_same<std::decay_t<U>, Status>::value>>
  StatusOr(U&& v) : status_(Status::OK()), value_(std::forward<U>(v)) {}
  const Status& status() const { return status_; }
  bool ok() const { return status_.ok(); }
  const T& value() const { return value_; }
  T& value() { return value_; }

 private:
  Status status_;
  T value_{};
};

inline const char* StatusCodeName(StatusCode code) {
  switch (code) {
    case StatusCode::kOk:
      return "ok";
    case StatusCode::kInvalidArgument:
      return "invalid_argument";
    case StatusCode::kUnavailable:
      return "unavailable";
    case StatusCode::kInternal:
      return "internal";
  }
  return "unknown";
}

inline std::string Status::ToString() const {
  if (ok()) {
    return "ok";
  }
  return std::string(StatusCodeName(code)) + ": " + message;
}

}  // namespace dlscript::util

#endif  // DLSCRIPT_UTIL_STATUS_H_
