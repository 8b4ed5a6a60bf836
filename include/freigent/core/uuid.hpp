#pragma once

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <string>

namespace freigent {

// UUID v4 generator, safe to call from any thread.
// Message ids come from here, so every send in the process gets a distinct id.
class UUID {
 public:
  static std::string generate() {
    uint64_t ab;
    uint64_t cd;
    {
      std::lock_guard<std::mutex> lock(mutex());
      ab = dist()(engine());
      cd = dist()(engine());
    }

    // Version 4 (random), RFC 4122 variant
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << (ab >> 32) << "-";
    ss << std::setw(4) << ((ab >> 16) & 0xFFFF) << "-";
    ss << std::setw(4) << (ab & 0xFFFF) << "-";
    ss << std::setw(4) << (cd >> 48) << "-";
    ss << std::setw(12) << (cd & 0x0000FFFFFFFFFFFFULL);
    return ss.str();
  }

 private:
  static std::mutex &mutex() {
    static std::mutex m;
    return m;
  }

  static std::mt19937_64 &engine() {
    static std::mt19937_64 gen(std::random_device{}());
    return gen;
  }

  static std::uniform_int_distribution<uint64_t> &dist() {
    static std::uniform_int_distribution<uint64_t> d;
    return d;
  }
};

}  // namespace freigent
