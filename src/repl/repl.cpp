#include "repl/repl.h"

#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "lexer/lexer.h"
#include "parser/parser.h"
#include "runtime/ops.h"
#include "util/error.h"
#include "util/log.h"
#include "util/string.h"

namespace dlscript::repl {

namespace {

void LogReplError(const util::Error& err) {
  util::LogRecord record;
  record.level = util::LogLevel::kDebug;
  record.component = "repl";
  record.line = err.line();
  record.column = err.column();
  record.message = err.what();
  util::Log(record);
}

}  // namespace

Repl::Repl() : env_(std::make_shared<runtime::Environment>()), dispatcher_(std::cout) {}

Repl::~Repl() {
  env_->Clear();
}

void Repl::Run() {
  std::string line;
  while (true) {
    std::cout << (pending_.empty() ? "dlscript> " : "     ...> ") << std::flush;
    if (!std::getline(std::cin, line)) {
      if (!pending_.empty()) {
        TryEvaluate(true);
      }
      std::cout << "\n";
      break;
    }
    if (ProcessLine(line)) {
      break;
    }
  }
}

bool Repl::ProcessLine(const std::string& line) {
  std::string trimmed = util::Trim(line);
  if (trimmed.empty()) {
    // A blank line ends a multi-line entry even if it does not parse yet.
    if (!pending_.empty()) {
      TryEvaluate(true);
    }
    return false;
  }
  if (trimmed == "exit" && pending_.empty()) {
    return true;
  }
  pending_ += line;
  pending_ += "\n";
  TryEvaluate(false);
  return false;
}

void Repl::TryEvaluate(bool force) {
  parser::Program program;
  try {
    parser::Parser line_parser(lexer::Tokenize(pending_));
    program = line_parser.ParseProgram();
  } catch (const parser::ParseError& err) {
    if (!force && err.found() == lexer::TokenType::kEof) {
      return;
    }
    pending_.clear();
    LogReplError(err);
    std::cout << err.formatted() << "\n";
    return;
  } catch (const util::Error& err) {
    pending_.clear();
    LogReplError(err);
    std::cout << err.formatted() << "\n";
    return;
  }
  pending_.clear();

  try {
    runtime::Evaluator evaluator(env_, &dispatcher_);
    std::optional<runtime::Value> last;
    for (const auto& stmt : program.statements) {
      last = evaluator.EvaluateStatement(*stmt);
    }
    const bool trailing_expr =
        !program.statements.empty() &&
        dynamic_cast<const parser::ExpressionStatement*>(program.statements.back().get()) !=
            nullptr;
    if (trailing_expr && last.has_value() && !last->IsNone()) {
      std::cout << last->ToString() << "\n";
    }
  } catch (const util::Error& err) {
    LogReplError(err);
    std::cout << err.formatted() << "\n";
  } catch (const std::exception& ex) {
    std::cout << "Unhandled error: " << ex.what() << "\n";
  }
}

}  // namespace dlscript::repl
