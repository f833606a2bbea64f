#ifndef CORESIDENCY_TESTS_COMMON_CLI_DISPATCH_HPP_
#define CORESIDENCY_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace coresidency::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return coresidency::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

struct DispatchResult {
  int exit_code = 0;
  std::string out;
  std::string err;
};

// Runs the router with std::cout and std::cerr redirected into strings.
inline DispatchResult DispatchCaptured(const std::vector<std::string>& argv_storage) {
  std::ostringstream captured_out;
  std::ostringstream captured_err;
  std::streambuf* original_out = std::cout.rdbuf(captured_out.rdbuf());
  std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());
  const int exit_code = DispatchArgs(argv_storage);
  std::cout.rdbuf(original_out);
  std::cerr.rdbuf(original_err);
  return {.exit_code = exit_code, .out = captured_out.str(), .err = captured_err.str()};
}

} // namespace coresidency::tests::common

#endif // CORESIDENCY_TESTS_COMMON_CLI_DISPATCH_HPP_
