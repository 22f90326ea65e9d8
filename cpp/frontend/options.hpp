#ifndef FRONTEND_OPTIONS_HPP
#define FRONTEND_OPTIONS_HPP

#include <kj/main.h>

#include "config/config.hpp"

namespace frontend {

// Adds the options shared by all the subcommands, which override the values
// read from the environment.
kj::MainBuilder& AddConfigOptions(kj::MainBuilder& builder);  // NOLINT

// Loads the configuration, exiting with an error message if it is not usable.
config::Config LoadConfigOrExit(kj::ProcessContext& context);  // NOLINT

}  // namespace frontend

#endif
