#include "UuidUtils.hpp"
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace calsync {

std::string UuidUtils::generate() {
  static std::mutex mtx;
  static std::mt19937_64 engine{std::random_device{}()};

  uint64_t hi, lo;
  {
    std::lock_guard<std::mutex> lock(mtx);
    hi = engine();
    lo = engine();
  }
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // RFC 4122 variant

  std::ostringstream out;
  out << std::hex << std::setfill('0') << std::setw(8) << (hi >> 32) << '-'
      << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-' << std::setw(4)
      << (hi & 0xFFFF) << '-' << std::setw(4) << (lo >> 48) << '-'
      << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
  return out.str();
}

} // namespace calsync
