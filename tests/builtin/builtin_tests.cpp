#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "builtin/builtins.h"
#include "test_util.h"

namespace test {

void RunBuiltinTests(TestContext* ctx) {
  {
    std::ostringstream out;
    bt::HostDispatcher host(out);
    auto env = std::make_shared<rt::Environment>();
    RunProgram("print(1 + 1); print(\"hello\"); print([[1, 2]]); print([1, \"a\"]);", env, &host);
    ExpectTrue(out.str() == "2\nhello\n[[1, 2]]\n[1, \"a\"]\n", "print_renders_values", ctx);
    auto result = host.Dispatch(bt::CallCategory::kIo, "print", {rt::Value::Number(0.25)});
    ExpectTrue(result.ok() && result.value().IsNone(), "print_returns_none", ctx);
  }

  {
    const std::filesystem::path root = MakeTempDir("dlscript_io_test_");
    ScopedEnvVar io_root("DLSCRIPT_IO_ROOT", root.string());
    std::ostringstream out;
    bt::HostDispatcher host(out);
    auto env = std::make_shared<rt::Environment>();
    RunProgram("write_file(\"notes.txt\", \"line one\"); t = read_file(\"notes.txt\");", env,
               &host);
    ExpectTrue(std::filesystem::exists(root / "notes.txt"), "write_file_under_io_root", ctx);
    ExpectTrue(env->Get("t")->IsString() && env->Get("t")->str == "line one",
               "read_file_returns_text", ctx);

    RunProgram("write_file(\"m.txt\", [[1, 2], [3, 4]]);", env, &host);
    std::ifstream in(root / "m.txt");
    std::stringstream contents;
    contents << in.rdbuf();
    ExpectTrue(contents.str() == "[[1, 2], [3, 4]]", "write_file_renders_value", ctx);

    bool failed = false;
    try {
      RunProgram("d = read_file(\"missing.csv\");", env, &host);
    } catch (const rt::RuntimeError& err) {
      failed = err.kind() == rt::RuntimeErrorKind::kDispatchFailure &&
               err.dispatch_status()->code == util::StatusCode::kUnavailable;
    }
    ExpectTrue(failed, "read_missing_file_fails", ctx);
    std::filesystem::remove_all(root);
  }

  ExpectTrue(bt::ResolveIoPath("/abs/path.txt") == std::filesystem::path("/abs/path.txt"),
             "absolute_path_unchanged", ctx);

  {
    std::ostringstream out;
    bt::HostDispatcher host(out);
    auto ml = host.Dispatch(bt::CallCategory::kMl, "kmeans",
                            {rt::Value::List({}), rt::Value::Number(2)});
    ExpectTrue(!ml.ok() && ml.status().code == util::StatusCode::kUnavailable &&
                   ml.status().message.find("kmeans") != std::string::npos,
               "ml_keywords_unavailable", ctx);
    auto plot = host.Dispatch(bt::CallCategory::kPlot, "histogram", {rt::Value::Number(1)});
    ExpectTrue(!plot.ok() && plot.status().code == util::StatusCode::kUnavailable,
               "plot_keywords_unavailable", ctx);
    auto bad = host.Dispatch(bt::CallCategory::kIo, "read_file", {rt::Value::Number(1)});
    ExpectTrue(!bad.ok() && bad.status().code == util::StatusCode::kInvalidArgument,
               "read_file_rejects_non_string_path", ctx);
    auto arity = host.Dispatch(bt::CallCategory::kIo, "print", {});
    ExpectTrue(!arity.ok() && arity.status().code == util::StatusCode::kInvalidArgument,
               "print_checks_arity", ctx);
    ExpectTrue(out.str().empty(), "failed_calls_print_nothing", ctx);
  }
}

}  // namespace test
