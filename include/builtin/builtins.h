#ifndef DLSCRIPT_BUILTIN_BUILTINS_H_
#define DLSCRIPT_BUILTIN_BUILTINS_H_

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "builtin/dispatch.h"

namespace dlscript::builtin {

/// Dispatcher used by the CLI and the REPL.
///
/// print writes to `out`; read_file/write_file touch the filesystem, resolving relative paths
/// against DLSCRIPT_IO_ROOT (or the working directory). ML and plot keywords have no host
/// implementation and fail with an unavailable status.
class HostDispatcher : public Dispatcher {
 public:
  explicit HostDispatcher(std::ostream& out) : out_(out) {}

  util::StatusOr<runtime::Value> Dispatch(CallCategory category, const std::string& keyword,
                                          const std::vector<runtime::Value>& args) override;

 private:
  util::StatusOr<runtime::Value> Print(const std::vector<runtime::Value>& args);
  util::StatusOr<runtime::Value> ReadFile(const std::vector<runtime::Value>& args);
  util::StatusOr<runtime::Value> WriteFile(const std::vector<runtime::Value>& args);

  std::ostream& out_;
};

/// Resolves a script-supplied path against DLSCRIPT_IO_ROOT when it is relative.
std::filesystem::path ResolveIoPath(const std::string& path);

}  // namespace dlscript::builtin

#endif  // DLSCRIPT_BUILTIN_BUILTINS_H_
