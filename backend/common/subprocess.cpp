#include "subprocess.hpp"
#include <boost/process.hpp>
#include <spdlog/spdlog.h>
#include <istream>

namespace bp = boost::process;

namespace common {

namespace {

boost::filesystem::path resolveProgram(const std::string& program) {
  if (program.find('/') != std::string::npos) {
    return boost::filesystem::path(program);
  }
  return bp::search_path(program);
}

} // namespace

std::string ProcessResult::lastLine() const {
  auto end = output.find_last_not_of("\r\n ");
  if (end == std::string::npos) {
    return {};
  }
  auto begin = output.find_last_of("\r\n", end);
  begin = (begin == std::string::npos) ? 0 : begin + 1;
  return output.substr(begin, end - begin + 1);
}

std::expected<ProcessResult, std::string> runProcess(const std::string& program,
                                                     const std::vector<std::string>& args,
                                                     size_t output_limit) {
  auto exe = resolveProgram(program);
  if (exe.empty()) {
    return std::unexpected(program + " not found in PATH");
  }

  spdlog::debug("running {} with {} argument(s)", exe.string(), args.size());

  try {
    bp::ipstream pipe;
    bp::child child(exe, bp::args(args), bp::std_in < bp::null, (bp::std_out & bp::std_err) > pipe);

    // drain the pipe while the child runs, keeping only the tail
    ProcessResult result;
    std::string line;
    while (std::getline(pipe, line)) {
      result.output += line;
      result.output += '\n';
      if (result.output.size() > output_limit) {
        result.output.erase(0, result.output.size() - output_limit);
      }
    }

    child.wait();
    result.exit_code = child.exit_code();
    return result;
  } catch (const bp::process_error& e) {
    return std::unexpected("failed to run " + program + ": " + e.what());
  }
}

bool isExecutableAvailable(const std::string& program) {
  auto exe = resolveProgram(program);
  if (exe.empty()) {
    return false;
  }
  boost::system::error_code ec;
  return boost::filesystem::is_regular_file(exe, ec) && !ec;
}

}
