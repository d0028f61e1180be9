#pragma once

#include <atomic>
#include <exception>
#include <functional>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "nexus_core/errors.hpp"
#include "nexus_core/log.hpp"

namespace nexus_core {

namespace stage {
constexpr const char *kInitializing = "initializing";
constexpr const char *kPopulationCreated = "population_created";
constexpr const char *kEvolving = "evolving";
constexpr const char *kFinalSelection = "final_selection";
constexpr const char *kFinalSimulation = "final_simulation";
constexpr const char *kCompleted = "completed";
constexpr const char *kError = "error";
} // namespace stage

using ProgressCallback = std::function<void(double, const std::string &)>;
using StatusCallback = std::function<void(const std::string &)>;

// Cancellation flag plus host callbacks. Every long loop calls checkpoint()
// at its suspension points.
class RunControl {
public:
  RunControl() : log_("control") {}

  void cancel() { cancelled_.store(true); }
  void reset() { cancelled_.store(false); }
  bool cancelled() const { return cancelled_.load(); }

  void checkpoint(const char *where) const {
    if (cancelled()) {
      throw CancelledError(fmt::format("Optimization cancelled during {}", where));
    }
  }

  void set_progress_callback(ProgressCallback cb) { progress_ = std::move(cb); }
  void set_status_callback(StatusCallback cb) { status_ = std::move(cb); }

  // Callback failures are logged and never interrupt the run.
  void progress(double percent, const std::string &stage_name) const {
    if (!progress_)
      return;
    try {
      progress_(percent, stage_name);
    } catch (const std::exception &e) {
      log_.warn("progress callback threw: {}", e.what());
    }
  }

  void status(const std::string &text) const {
    if (!status_)
      return;
    try {
      status_(text);
    } catch (const std::exception &e) {
      log_.warn("status callback threw: {}", e.what());
    }
  }

private:
  std::atomic<bool> cancelled_{false};
  ProgressCallback progress_;
  StatusCallback status_;
  Logger log_;
};

} // namespace nexus_core
