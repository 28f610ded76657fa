#include "builtin/builtins.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "util/log.h"

namespace dlscript::builtin {

namespace {

void LogHost(util::LogLevel level, const std::string& keyword, const std::string& message) {
  util::LogRecord record;
  record.level = level;
  record.component = "host";
  record.operation = keyword;
  record.message = message;
  util::Log(record);
}

util::Status CheckArity(const std::string& keyword, const std::vector<runtime::Value>& args,
                        size_t expected) {
  if (args.size() != expected) {
    return util::Status::Invalid(keyword + " expects " + std::to_string(expected) +
                                 " arguments, got " + std::to_string(args.size()));
  }
  return util::Status::OK();
}

util::Status CheckPath(const std::string& keyword, const runtime::Value& path) {
  if (!path.IsString() || path.str.empty()) {
    return util::Status::Invalid(keyword + " expects a non-empty string path");
  }
  return util::Status::OK();
}

}  // namespace

std::filesystem::path ResolveIoPath(const std::string& path) {
  std::filesystem::path p(path);
  if (p.is_absolute()) return p;
  if (const char* root = std::getenv("DLSCRIPT_IO_ROOT")) {
    if (root[0] != '\0') return std::filesystem::path(root) / p;
  }
  return p;
}

util::StatusOr<runtime::Value> HostDispatcher::Dispatch(CallCategory category,
                                                        const std::string& keyword,
                                                        const std::vector<runtime::Value>& args) {
  LogHost(util::LogLevel::kTrace, keyword,
          std::string("dispatch ") + CallCategoryName(category) + " with " +
              std::to_string(args.size()) + " args");
  util::StatusOr<runtime::Value> result = util::Status::Unavailable(
      std::string("no host implementation for ") + CallCategoryName(category) + " keyword '" +
      keyword + "'");
  if (category == CallCategory::kIo) {
    if (keyword == "print") {
      result = Print(args);
    } else if (keyword == "read_file") {
      result = ReadFile(args);
    } else if (keyword == "write_file") {
      result = WriteFile(args);
    } else {
      result = util::Status::Internal("unknown io keyword '" + keyword + "'");
    }
  }
  if (!result.ok()) {
    LogHost(util::LogLevel::kWarn, keyword, result.status().ToString());
  }
  return result;
}

util::StatusOr<runtime::Value> HostDispatcher::Print(const std::vector<runtime::Value>& args) {
  util::Status arity = CheckArity("print", args, 1);
  if (!arity.ok()) return arity;
  out_ << args[0].DisplayString() << "\n";
  out_.flush();
  return runtime::Value::None();
}

util::StatusOr<runtime::Value> HostDispatcher::ReadFile(
    const std::vector<runtime::Value>& args) {
  util::Status arity = CheckArity("read_file", args, 1);
  if (!arity.ok()) return arity;
  util::Status path_ok = CheckPath("read_file", args[0]);
  if (!path_ok.ok()) return path_ok;
  const std::filesystem::path path = ResolveIoPath(args[0].str);
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return util::Status::Unavailable("Failed to open file: " + path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return runtime::Value::String(ss.str());
}

util::StatusOr<runtime::Value> HostDispatcher::WriteFile(
    const std::vector<runtime::Value>& args) {
  util::Status arity = CheckArity("write_file", args, 2);
  if (!arity.ok()) return arity;
  util::Status path_ok = CheckPath("write_file", args[0]);
  if (!path_ok.ok()) return path_ok;
  const std::filesystem::path path = ResolveIoPath(args[0].str);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return util::Status::Unavailable("Failed to open file for write: " + path.string());
  }
  out << args[1].DisplayString();
  if (!out) {
    return util::Status::Unavailable("Failed to write file: " + path.string());
  }
  return runtime::Value::None();
}

}  // namespace dlscript::builtin
