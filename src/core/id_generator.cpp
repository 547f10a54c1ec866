#include "liftkit/core/id_generator.h"

#include <array>
#include <cstdint>

namespace liftkit::core {

namespace {

constexpr std::array<char, 16> kHexDigits = {'0', '1', '2', '3', '4', '5', '6', '7',
                                             '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

void append_hex(std::string& out, std::uint64_t bits, int digits) {
  for (int shift = (digits - 1) * 4; shift >= 0; shift -= 4) {
    out.push_back(kHexDigits[(bits >> shift) & 0xF]);
  }
}

}  // namespace

SystemIdGenerator::SystemIdGenerator() : engine_(std::random_device{}()) {}

std::string SystemIdGenerator::guid() {
  std::uint64_t high = 0;
  std::uint64_t low = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    high = engine_();
    low = engine_();
  }
  // Version 4 in the time_hi nibble, variant 10xx in clock_seq_hi.
  high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::string out;
  out.reserve(36);
  append_hex(out, high >> 32, 8);
  out.push_back('-');
  append_hex(out, (high >> 16) & 0xFFFF, 4);
  out.push_back('-');
  append_hex(out, high & 0xFFFF, 4);
  out.push_back('-');
  append_hex(out, low >> 48, 4);
  out.push_back('-');
  append_hex(out, low & 0xFFFFFFFFFFFFULL, 12);
  return out;
}

std::string SystemIdGenerator::next(std::string_view prefix) {
  return std::string(prefix) + "_" + guid();
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  return std::string(prefix) + "_" + std::to_string(counter_++);
}

}  // namespace liftkit::core
