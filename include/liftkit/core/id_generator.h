#pragma once

#include <mutex>
#include <random>
#include <string>
#include <string_view>

namespace liftkit::core {

// Abstract ID generator interface for dependency injection.
// The codec never invents entry or sense ids; hosts assign them through this
// interface before generation (see model::assign_missing_ids).
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Contract: returned ID is non-empty and starts with prefix.
  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// Production ID generator: "<prefix>_<guid>", the shape FieldWorks gives
// entry ids ("grass_0d1c3f00-...."). The guid is a random RFC 4122 version 4
// value. Thread-safe.
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator();
  ~SystemIdGenerator() override = default;

  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;
  SystemIdGenerator(SystemIdGenerator&&) = delete;
  SystemIdGenerator& operator=(SystemIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

  // guid returns a fresh lowercase "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx" value,
  // suitable for the LIFT guid attribute.
  std::string guid();

 private:
  std::mutex mutex_;
  std::mt19937_64 engine_;
};

// Deterministic ID generator: "<prefix>_<counter>", counting from zero across
// all prefixes. For tests and reproducible CLI output. Not thread-safe.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  std::string next(std::string_view prefix) override;

 private:
  unsigned long long counter_{0};
};

}  // namespace liftkit::core
