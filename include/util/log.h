#ifndef DLSCRIPT_UTIL_LOG_H_
#define DLSCRIPT_UTIL_LOG_H_

#include <string>

namespace dlscript::util {

enum class LogLevel { kError, kWarn, kInfo, kDebug, kTrace };
enum class LogFormat { kText, kJson };

struct LogRecord {
  LogLevel level = LogLevel::kInfo;
  std::string component;
  std::string message;
  std::string operation;
  int line = 0;
  int column = 0;
};

const char* LogLevelName(LogLevel level);
std::string FormatLogLine(const LogRecord& record, LogFormat format);
/// Writes the record to stderr when DLSCRIPT_LOG / DLSCRIPT_LOG_LEVEL allow its level.
void Log(const LogRecord& record);
bool LogEnabled(LogLevel level);

}  // namespace dlscript::util

#endif  // DLSCRIPT_UTIL_LOG_H_
