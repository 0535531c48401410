#include "microbench/core/types.hpp"

namespace microbench {

const char* phase_name(Phase phase) noexcept {
  switch (phase) {
    case Phase::Idle:
      return "idle";
    case Phase::Calibrating:
      return "calibrating";
    case Phase::WarmingUp:
      return "warming_up";
    case Phase::Planning:
      return "planning";
    case Phase::Sampling:
      return "sampling";
    case Phase::Finalizing:
      return "finalizing";
    case Phase::Done:
      return "done";
  }
  return "unknown";
}

const char* warning_name(Warning warning) noexcept {
  switch (warning) {
    case Warning::UnmeasurableExecution:
      return "unmeasurable_execution";
    case Warning::CostDrift:
      return "cost_drift";
    case Warning::FewResamples:
      return "few_resamples";
  }
  return "unknown";
}

const char* noise_class_name(NoiseClass noise) noexcept {
  switch (noise) {
    case NoiseClass::Unaffected:
      return "unaffected";
    case NoiseClass::Slight:
      return "slight";
    case NoiseClass::Moderate:
      return "moderate";
    case NoiseClass::Severe:
      return "severe";
  }
  return "unknown";
}

}  // namespace microbench
