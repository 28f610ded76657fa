#include <sstream>
#include <string>

#include "builtin/builtins.h"
#include "test_util.h"

namespace test {

namespace {

std::string RunWithHost(const std::string& source) {
  std::ostringstream out;
  bt::HostDispatcher host(out);
  auto env = std::make_shared<rt::Environment>();
  RunProgram(source, env, &host);
  env->Clear();
  return out.str();
}

}  // namespace

void RunInterpreterTests(TestContext* ctx) {
  ExpectTrue(RunWithHost("print(2 + 3 * 4); print(2 ^ 3 ^ 2);") == "14\n64\n",
             "precedence_end_to_end", ctx);

  const std::string fib =
      "def fib(n){\n"
      "  r = n;\n"
      "  if (n > 1) { r = fib(n - 1) + fib(n - 2); }\n"
      "  return r;\n"
      "}\n"
      "for(i = 0; i < 8; i = i + 1){ print(fib(i)); }\n";
  ExpectTrue(RunWithHost(fib) == "0\n1\n1\n2\n3\n5\n8\n13\n", "fibonacci_program", ctx);

  const std::string collatz =
      "n = 6; steps = 0;\n"
      "while (n != 1) {\n"
      "  if (n % 2 == 0) { n = n / 2; } else { n = 3 * n + 1; }\n"
      "  steps = steps + 1;\n"
      "}\n"
      "print(steps);\n";
  ExpectTrue(RunWithHost(collatz) == "8\n", "collatz_program", ctx);

  const std::string matrices =
      "A = [[2, 0], [0, 2]];\n"
      "B = [[1, 2], [3, 4]];\n"
      "C = matmult(A, B);\n"
      "print(C);\n"
      "print(matsub(C, B));\n"
      "print(transpose(B));\n";
  ExpectTrue(RunWithHost(matrices) == "[[2, 4], [6, 8]]\n[[1, 2], [3, 4]]\n[[1, 3], [2, 4]]\n",
             "matrix_program", ctx);

  const std::string strings =
      "def greet(name){ return \"hello, \" + name; }\n"
      "print(greet(\"dl\"));\n";
  ExpectTrue(RunWithHost(strings) == "hello, dl\n", "string_program", ctx);

  {
    // A full training pipeline against a stub dispatcher.
    bt::RecordingDispatcher dispatcher;
    dispatcher.SetResult("read_file", rt::Value::String("1,2\n3,4\n"));
    dispatcher.SetResult("neural_network", rt::Value::String("net"));
    dispatcher.SetResult("train", rt::Value::String("trained"));
    dispatcher.SetResult("predict", rt::Value::List({rt::Value::Number(1)}));
    auto env = std::make_shared<rt::Environment>();
    RunProgram(
        "raw = read_file(\"train.csv\");\n"
        "X = [[0, 0], [0, 1], [1, 0], [1, 1]];\n"
        "net = neural_network(2, [4, 4], 1);\n"
        "model = train(net, X);\n"
        "out = predict(model, [[1, 1]]);\n"
        "scatter(X, out);\n"
        "print(out);\n",
        env, &dispatcher);
    const auto& calls = dispatcher.calls();
    ExpectTrue(calls.size() == 6, "pipeline_call_count", ctx);
    if (calls.size() == 6) {
      ExpectTrue(calls[0].keyword == "read_file" && calls[0].args[0].str == "train.csv",
                 "pipeline_read_file_path", ctx);
      ExpectTrue(calls[1].keyword == "neural_network" && calls[1].args[1].IsList() &&
                     calls[1].args[1].list.size() == 2,
                 "pipeline_network_layers", ctx);
      ExpectTrue(calls[2].args[0].str == "net" && calls[2].args[1].IsMatrix() &&
                     calls[2].args[1].matrix.rows == 4,
                 "pipeline_train_args", ctx);
      ExpectTrue(calls[4].category == bt::CallCategory::kPlot && calls[4].args[1].IsList(),
                 "pipeline_scatter_category", ctx);
      ExpectTrue(calls[5].category == bt::CallCategory::kIo && calls[5].keyword == "print",
                 "pipeline_print_last", ctx);
    }
    ExpectTrue(env->Get("raw")->str == "1,2\n3,4\n", "pipeline_read_result_bound", ctx);
  }

  {
    auto got = RuntimeErrorOf("x = [[1,2],[3,4]]; y = [1,2,[3,4]];");
    ExpectTrue(got.has_value() && *got == rt::RuntimeErrorKind::kShape,
               "mixed_rows_after_matrix", ctx);
  }

  {
    auto env = std::make_shared<rt::Environment>();
    RunProgram("x = [[1,2],[3,4]];", env);
    auto x = env->Get("x");
    ExpectTrue(x.has_value() && x->IsMatrix() && x->matrix.rows == 2 && x->matrix.cols == 2,
               "matrix_classification", ctx);
  }
}

}  // namespace test
