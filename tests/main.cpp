#include <exception>
#include <iostream>

#include "test_util.h"

namespace test {
void RunLexerTests(TestContext* ctx);
void RunParserTests(TestContext* ctx);
void RunRuntimeTests(TestContext* ctx);
void RunMatrixTests(TestContext* ctx);
void RunErrorLocationTests(TestContext* ctx);
void RunDispatchTests(TestContext* ctx);
void RunBuiltinTests(TestContext* ctx);
void RunUtilTests(TestContext* ctx);
void RunReplTests(TestContext* ctx);
void RunInterpreterTests(TestContext* ctx);
}  // namespace test

int main() {
  test::TestContext ctx;
  try {
    test::RunLexerTests(&ctx);
    test::RunParserTests(&ctx);
    test::RunRuntimeTests(&ctx);
    test::RunMatrixTests(&ctx);
    test::RunErrorLocationTests(&ctx);
    test::RunDispatchTests(&ctx);
    test::RunBuiltinTests(&ctx);
    test::RunUtilTests(&ctx);
    test::RunReplTests(&ctx);
    test::RunInterpreterTests(&ctx);
  } catch (const std::exception& ex) {
    std::cerr << "[FAIL] unexpected exception: " << ex.what() << "\n";
    ++ctx.failed;
  }

  std::cout << "[RESULT] passed=" << ctx.passed << " failed=" << ctx.failed << "\n";
  return ctx.failed == 0 ? 0 : 1;
}
