#include "test_util.h"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <sstream>

#include "runtime/runner.h"

namespace test {

void ExpectNear(double actual, double expected, const std::string& name, TestContext* ctx) {
  if (std::fabs(actual - expected) <= kEpsilon) {
    ++ctx->passed;
    return;
  }
  ++ctx->failed;
  std::cerr << "[FAIL] " << name << " expected " << expected << " got " << actual << "\n";
}

void ExpectTrue(bool value, const std::string& name, TestContext* ctx) {
  if (value) {
    ++ctx->passed;
    return;
  }
  ++ctx->failed;
  std::cerr << "[FAIL] " << name << " expected true\n";
}

rt::Value EvalExpr(const std::string& expr, std::shared_ptr<rt::Environment> env,
                   bt::Dispatcher* dispatcher) {
  ps::Parser parser(lx::Tokenize(expr));
  auto ast = parser.ParseExpression();
  rt::Evaluator evaluator(std::move(env), dispatcher);
  return evaluator.Evaluate(*ast);
}

std::optional<rt::Value> RunProgram(const std::string& source,
                                    std::shared_ptr<rt::Environment> env,
                                    bt::Dispatcher* dispatcher) {
  return rt::RunSource(source, std::move(env), dispatcher);
}

std::optional<rt::RuntimeErrorKind> RuntimeErrorOf(const std::string& source,
                                                   bt::Dispatcher* dispatcher) {
  auto env = std::make_shared<rt::Environment>();
  std::optional<rt::RuntimeErrorKind> kind;
  try {
    rt::RunSource(source, env, dispatcher);
  } catch (const rt::RuntimeError& err) {
    kind = err.kind();
  }
  env->Clear();
  return kind;
}

const rt::Value& Unwrap(const std::optional<rt::Value>& v, const std::string& name,
                        TestContext* ctx) {
  ExpectTrue(v.has_value(), name + "_present", ctx);
  static rt::Value empty{};
  return v.has_value() ? v.value() : empty;
}

std::filesystem::path MakeTempDir(const std::string& prefix) {
  const auto base = std::filesystem::temp_directory_path();
  const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  std::ostringstream name;
  name << prefix << now;
  std::filesystem::path path = base / name.str();
  std::filesystem::create_directories(path);
  return path;
}

ScopedEnvVar::ScopedEnvVar(const std::string& name, const std::string& value) : name_(name) {
  if (const char* old = std::getenv(name.c_str())) {
    previous_ = std::string(old);
  }
  setenv(name.c_str(), value.c_str(), 1);
}

ScopedEnvVar::~ScopedEnvVar() {
  if (previous_.has_value()) {
    setenv(name_.c_str(), previous_->c_str(), 1);
  } else {
    unsetenv(name_.c_str());
  }
}

}  // namespace test
