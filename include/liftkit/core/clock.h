#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace liftkit::core {

// Renders a point in time the way LIFT dateCreated/dateModified carry it:
// UTC with second precision, e.g. "2026-01-01T00:00:00Z".
std::string format_lift_timestamp(std::chrono::system_clock::time_point when);

// Source of entry modification stamps.
class IClock {
 public:
  virtual ~IClock() = default;

  virtual std::string timestamp() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  std::string timestamp() override;
};

// Always reports the same stamp.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string stamp) : stamp_(std::move(stamp)) {}

  std::string timestamp() override { return stamp_; }

 private:
  std::string stamp_;
};

}  // namespace liftkit::core
