#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace common {

struct ProcessResult {
  int exit_code{0};
  std::string output;  // tail of the merged stdout/stderr

  bool success() const { return exit_code == 0; }
  // Last non-empty line of output, useful for error messages.
  std::string lastLine() const;
};

// Runs program with args (no shell), stdin closed, and waits for it.
// Fails only when the process could not be started.
std::expected<ProcessResult, std::string> runProcess(const std::string& program,
                                                     const std::vector<std::string>& args,
                                                     size_t output_limit = 16 * 1024);

// Whether program resolves to an executable, either as a path or via PATH.
bool isExecutableAvailable(const std::string& program);

}
