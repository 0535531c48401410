#pragma once

#include "app/config_types.hpp"

namespace microbench::app {

EnvironmentInfo collect_environment();

}  // namespace microbench::app
