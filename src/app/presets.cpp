#include "app/presets.hpp"

#include <chrono>
#include <string>

namespace microbench::app {

using namespace std::chrono_literals;

const char* preset_name(Preset preset) noexcept {
  switch (preset) {
    case Preset::Default:
      return "default";
    case Preset::Quick:
      return "quick";
    case Preset::Thorough:
      return "thorough";
  }
  return "unknown";
}

Expected<Preset> parse_preset(std::string_view text) {
  for (const auto p : {Preset::Default, Preset::Quick, Preset::Thorough}) {
    if (text == preset_name(p)) {
      return p;
    }
  }
  return std::unexpected(Error{ErrorCode::InvalidConfiguration, "invalid --preset: " + std::string(text)});
}

void apply_preset(Preset preset, BenchmarkConfig& cfg) noexcept {
  switch (preset) {
    case Preset::Default: {
      const BenchmarkConfig defaults{};
      cfg.warmup_duration = defaults.warmup_duration;
      cfg.target_sample_duration = defaults.target_sample_duration;
      cfg.sample_count = defaults.sample_count;
      cfg.bootstrap_resample_count = defaults.bootstrap_resample_count;
      return;
    }
    case Preset::Quick:
      cfg.warmup_duration = 20ms;
      cfg.target_sample_duration = 500us;
      cfg.sample_count = 30;
      cfg.bootstrap_resample_count = 2000;
      return;
    case Preset::Thorough:
      cfg.warmup_duration = 1s;
      cfg.target_sample_duration = 5ms;
      cfg.sample_count = 200;
      cfg.bootstrap_resample_count = 100'000;
      return;
  }
}

}  // namespace microbench::app
