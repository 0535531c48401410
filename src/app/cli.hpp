#pragma once

#include "app/config_types.hpp"
#include "microbench/core/expected.hpp"

namespace microbench::app {

Expected<Config> parse_args(int argc, char** argv);

}  // namespace microbench::app

int run_cli_impl(int argc, char** argv);
