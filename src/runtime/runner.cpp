#include "runtime/runner.h"

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "lexer/lexer.h"
#include "parser/parser.h"
#include "runtime/ops.h"
#include "util/error.h"
#include "util/log.h"

namespace dlscript::runtime {

namespace {

using Clock = std::chrono::steady_clock;

void LogStage(const char* stage, Clock::time_point start, const std::string& detail) {
  if (!util::LogEnabled(util::LogLevel::kDebug)) return;
  const auto elapsed =
      std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();
  util::LogRecord record;
  record.level = util::LogLevel::kDebug;
  record.component = "runner";
  record.operation = stage;
  record.message = detail + " in " + std::to_string(elapsed) + "us";
  util::Log(record);
}

}  // namespace

std::optional<Value> RunSource(const std::string& source, std::shared_ptr<Environment> env,
                               builtin::Dispatcher* dispatcher) {
  try {
    auto start = Clock::now();
    std::vector<lexer::Token> tokens = lexer::Tokenize(source);
    LogStage("lex", start, std::to_string(tokens.size()) + " tokens");

    start = Clock::now();
    parser::Parser program_parser(std::move(tokens));
    parser::Program program = program_parser.ParseProgram();
    LogStage("parse", start, std::to_string(program.statements.size()) + " statements");

    start = Clock::now();
    Evaluator evaluator(std::move(env), dispatcher);
    std::optional<Value> result = evaluator.ExecuteStatements(program.statements);
    LogStage("evaluate", start, "program finished");
    return result;
  } catch (const util::Error& err) {
    util::LogRecord record;
    record.level = util::LogLevel::kDebug;
    record.component = "runner";
    record.operation = "run";
    record.line = err.line();
    record.column = err.column();
    record.message = err.what();
    util::Log(record);
    throw;
  }
}

}  // namespace dlscript::runtime
