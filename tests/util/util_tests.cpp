#include <iostream>
#include <sstream>
#include <string>

#include "test_util.h"
#include "util/log.h"
#include "util/status.h"
#include "util/string.h"

namespace test {

namespace {

class StderrCapture {
 public:
  StderrCapture() : orig_(std::cerr.rdbuf(buffer_.rdbuf())) {}
  ~StderrCapture() { std::cerr.rdbuf(orig_); }
  std::string str() const { return buffer_.str(); }

 private:
  std::ostringstream buffer_;
  std::streambuf* orig_;
};

}  // namespace

void RunUtilTests(TestContext* ctx) {
  ExpectTrue(util::Trim("  x = 1;\t\n") == "x = 1;", "trim_whitespace", ctx);
  ExpectTrue(util::Trim("   ").empty(), "trim_all_space", ctx);

  util::Status bad = util::Status::Invalid("bad input");
  ExpectTrue(!bad.ok() && bad.ToString() == "invalid_argument: bad input", "status_to_string",
             ctx);
  ExpectTrue(util::Status::OK().ToString() == "ok", "status_ok_string", ctx);
  util::StatusOr<int> failed = util::Status::Unavailable("offline");
  ExpectTrue(!failed.ok() && failed.status().code == util::StatusCode::kUnavailable,
             "status_or_failure", ctx);
  util::StatusOr<int> value = 7;
  ExpectTrue(value.ok() && value.value() == 7, "status_or_value", ctx);

  util::LogRecord rec;
  rec.level = util::LogLevel::kWarn;
  rec.component = "host";
  rec.operation = "read_file";
  rec.line = 3;
  rec.column = 9;
  rec.message = "Failed to open \"x.csv\"";

  std::string text = util::FormatLogLine(rec, util::LogFormat::kText);
  ExpectTrue(text.rfind("level=warn component=host op=read_file line=3 column=9", 0) == 0,
             "log_text_fields", ctx);
  ExpectTrue(text.find("message=\"Failed to open \\\"x.csv\\\"\"") != std::string::npos,
             "log_text_escapes_quotes", ctx);

  std::string json = util::FormatLogLine(rec, util::LogFormat::kJson);
  ExpectTrue(json.find("\"level\":\"warn\"") != std::string::npos, "log_json_level", ctx);
  ExpectTrue(json.find("\"component\":\"host\"") != std::string::npos, "log_json_component",
             ctx);
  ExpectTrue(json.find("\"line\":3,\"column\":9") != std::string::npos, "log_json_location",
             ctx);
  ExpectTrue(json.front() == '{' && json.back() == '}', "log_json_object", ctx);

  util::LogRecord bare;
  bare.message = "started";
  ExpectTrue(util::FormatLogLine(bare, util::LogFormat::kText) ==
                 "level=info message=\"started\"",
             "log_text_omits_empty_fields", ctx);

  {
    ScopedEnvVar level("DLSCRIPT_LOG_LEVEL", "warn");
    ExpectTrue(util::LogEnabled(util::LogLevel::kError), "log_level_allows_error", ctx);
    ExpectTrue(util::LogEnabled(util::LogLevel::kWarn), "log_level_allows_warn", ctx);
    ExpectTrue(!util::LogEnabled(util::LogLevel::kDebug), "log_level_filters_debug", ctx);
  }
  {
    ScopedEnvVar enable("DLSCRIPT_LOG", "yes");
    ScopedEnvVar format("DLSCRIPT_LOG_FORMAT", "json");
    StderrCapture capture;
    util::Log(rec);
    util::LogRecord debug;
    debug.level = util::LogLevel::kDebug;
    debug.message = "hidden";
    util::Log(debug);
    const std::string logged = capture.str();
    ExpectTrue(logged.find("\"level\":\"warn\"") != std::string::npos, "log_writes_json", ctx);
    ExpectTrue(logged.find("hidden") == std::string::npos, "log_info_filters_debug", ctx);
  }
  {
    ScopedEnvVar level("DLSCRIPT_LOG_LEVEL", "trace");
    ScopedEnvVar format("DLSCRIPT_LOG_FORMAT", "text");
    StderrCapture capture;
    RunProgram("x = 1;", std::make_shared<rt::Environment>());
    const std::string logged = capture.str();
    ExpectTrue(logged.find("component=runner op=parse") != std::string::npos,
               "runner_logs_stages", ctx);
  }
}

}  // namespace test
