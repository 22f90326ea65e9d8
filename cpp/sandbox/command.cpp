#include "sandbox/command.hpp"

#include <algorithm>

namespace sandbox {

namespace {
const constexpr char* kEnvFlag = "--env";
const constexpr char* kDefaultEnv[] = {"PYTHONUNBUFFERED=1",
                                       "PYTHONDONTWRITEBYTECODE=1"};

std::string NameOf(const std::string& assignment) {
  return assignment.substr(0, assignment.find('='));
}
}  // namespace

std::vector<std::string> EnvNames(const std::vector<std::string>& args) {
  const std::string inline_flag = std::string(kEnvFlag) + "=";
  std::vector<std::string> names;
  for (size_t i = 0; i < args.size(); i++) {
    if (args[i] == kEnvFlag && i + 1 < args.size()) {
      names.push_back(NameOf(args[++i]));
    } else if (args[i].compare(0, inline_flag.size(), inline_flag) == 0) {
      names.push_back(NameOf(args[i].substr(inline_flag.size())));
    }
  }
  return names;
}

std::vector<std::string> BuildCommand(const config::Config& config,
                                      const std::string& code) {
  std::vector<std::string> cmd = {config.runtime_path, "run"};
  cmd.insert(cmd.end(), config.runtime_args.begin(), config.runtime_args.end());

  std::vector<std::string> present = EnvNames(config.runtime_args);
  for (const char* env : kDefaultEnv) {
    if (std::find(present.begin(), present.end(), NameOf(env)) !=
        present.end()) {
      continue;
    }
    cmd.push_back(kEnvFlag);
    cmd.push_back(env);
  }

  cmd.push_back(config.module_path);
  if (config.isolated) cmd.push_back("-I");
  cmd.push_back("-c");
  cmd.push_back(code);
  return cmd;
}

}  // namespace sandbox
