#pragma once

#include <string_view>

#include "app/config_types.hpp"
#include "microbench/core/expected.hpp"

namespace microbench::app {

const char* preset_name(Preset preset) noexcept;
Expected<Preset> parse_preset(std::string_view text);

// Overwrites the timing, sample and resample knobs of cfg; leaves the
// quiescence switch, pinned overhead and seed alone.
void apply_preset(Preset preset, BenchmarkConfig& cfg) noexcept;

}  // namespace microbench::app
