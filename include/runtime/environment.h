#ifndef DLSCRIPT_RUNTIME_ENVIRONMENT_H_
#define DLSCRIPT_RUNTIME_ENVIRONMENT_H_

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "runtime/value.h"

namespace dlscript::runtime {

/// One frame of bindings. A function call gets a fresh frame whose parent is the function's
/// defining environment; blocks run in the frame that encloses them.
class Environment {
 public:
  explicit Environment(std::shared_ptr<Environment> parent = nullptr)
      : parent_(std::move(parent)) {}

  /// Stores or replaces a named value in this frame.
  void Define(const std::string& name, const Value& value) { values_[name] = value; }

  /// Looks up a name, returning std::nullopt if it is undefined.
  std::optional<Value> Get(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
      if (!parent_) {
        return std::nullopt;
      }
      return parent_->Get(name);
    }
    return it->second;
  }

  /// True when this frame itself binds `name`.
  bool HasLocal(const std::string& name) const { return values_.count(name) > 0; }

  /// Drops every binding of this frame. Breaks closure reference cycles at shutdown.
  void Clear() { values_.clear(); }

  const std::shared_ptr<Environment>& parent() const { return parent_; }

 private:
  std::unordered_map<std::string, Value> values_;
  std::shared_ptr<Environment> parent_;
};

}  // namespace dlscript::runtime

#endif  // DLSCRIPT_RUNTIME_ENVIRONMENT_H_
