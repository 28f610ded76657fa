#include "util/log.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>

namespace dlscript::util {

namespace {

struct LogConfig {
  bool enabled = false;
  LogLevel level = LogLevel::kError;
  LogFormat format = LogFormat::kText;
};

std::string Lower(const char* value) {
  std::string v(value);
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return v;
}

bool IsTrueEnv(const char* value) {
  if (!value) return false;
  const std::string v = Lower(value);
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

LogLevel ParseLogLevel(const char* value) {
  if (!value) return LogLevel::kError;
  const std::string v = Lower(value);
  if (v == "error") return LogLevel::kError;
  if (v == "warn" || v == "warning") return LogLevel::kWarn;
  if (v == "info") return LogLevel::kInfo;
  if (v == "debug") return LogLevel::kDebug;
  if (v == "trace") return LogLevel::kTrace;
  return LogLevel::kError;
}

LogFormat ParseLogFormat(const char* value) {
  if (!value) return LogFormat::kText;
  if (Lower(value) == "json") return LogFormat::kJson;
  return LogFormat::kText;
}

LogConfig LoadLogConfig() {
  LogConfig config;
  if (const char* level = std::getenv("DLSCRIPT_LOG_LEVEL")) {
    config.enabled = true;
    config.level = ParseLogLevel(level);
  }
  if (const char* fmt = std::getenv("DLSCRIPT_LOG_FORMAT")) {
    config.format = ParseLogFormat(fmt);
  }
  if (const char* enable = std::getenv("DLSCRIPT_LOG")) {
    if (IsTrueEnv(enable) && !config.enabled) {
      config.enabled = true;
      config.level = LogLevel::kInfo;
    }
  }
  return config;
}

bool ShouldLog(const LogConfig& config, LogLevel level) {
  return config.enabled && static_cast<int>(level) <= static_cast<int>(config.level);
}

std::string JsonEscape(const std::string& input) {
  std::string out;
  out.reserve(input.size() + 8);
  for (char c : input) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(c);
        break;
    }
  }
  return out;
}

std::string TextEscape(const std::string& input) {
  std::string out;
  out.reserve(input.size() + 8);
  for (char c : input) {
    if (c == '"') {
      out += "\\\"";
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\r') {
      out += "\\r";
    } else if (c == '\t') {
      out += "\\t";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::mutex g_log_mu;

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kError:
      return "error";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kTrace:
      return "trace";
  }
  return "info";
}

std::string FormatLogLine(const LogRecord& record, LogFormat format) {
  if (format == LogFormat::kJson) {
    std::ostringstream out;
    out << "{";
    out << "\"level\":\"" << LogLevelName(record.level) << "\"";
    if (!record.component.empty()) {
      out << ",\"component\":\"" << JsonEscape(record.component) << "\"";
    }
    if (!record.operation.empty()) {
      out << ",\"op\":\"" << JsonEscape(record.operation) << "\"";
    }
    if (record.line > 0) {
      out << ",\"line\":" << record.line << ",\"column\":" << record.column;
    }
    out << ",\"message\":\"" << JsonEscape(record.message) << "\"";
    out << "}";
    return out.str();
  }

  std::ostringstream out;
  out << "level=" << LogLevelName(record.level);
  if (!record.component.empty()) out << " component=" << record.component;
  if (!record.operation.empty()) out << " op=" << record.operation;
  if (record.line > 0) out << " line=" << record.line << " column=" << record.column;
  out << " message=\"" << TextEscape(record.message) << "\"";
  return out.str();
}

bool LogEnabled(LogLevel level) {
  return ShouldLog(LoadLogConfig(), level);
}

void Log(const LogRecord& record) {
  const LogConfig config = LoadLogConfig();
  if (!ShouldLog(config, record.level)) return;
  const std::string line = FormatLogLine(record, config.format);
  std::lock_guard<std::mutex> lock(g_log_mu);
  std::cerr << line << "\n";
}

}  // namespace dlscript::util
