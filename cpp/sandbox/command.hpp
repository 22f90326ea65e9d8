#ifndef SANDBOX_COMMAND_HPP
#define SANDBOX_COMMAND_HPP

#include <string>
#include <vector>
#include "config/config.hpp"

namespace sandbox {

// Builds the argument vector that runs code in the isolated interpreter:
//   <runtime> run <runtime args...> --env PYTHONUNBUFFERED=1
//       --env PYTHONDONTWRITEBYTECODE=1 <module> [-I] -c <code>
// Environment variables already set by the runtime args are not repeated.
// No host directory is ever preopened.
std::vector<std::string> BuildCommand(const config::Config& config,
                                      const std::string& code);

// Returns the names of the variables set by --env options in args, in both
// the "--env K=V" and "--env=K=V" forms.
std::vector<std::string> EnvNames(const std::vector<std::string>& args);

}  // namespace sandbox

#endif
