#include "Random.h"
#include "Utilities.h"

#include <limits>
#include <sodium.h>
#include <stdexcept>

namespace fv {

std::string RandomSource::newIdentifier() {
  unsigned char bytes[16];
  fill(bytes, sizeof(bytes));
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40); // version 4
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80); // RFC 4122 variant

  std::string hex =
      utl::hexEncode(std::string(reinterpret_cast<const char *>(bytes), 16));
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
         "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

// ----- SeededRandom -----

SeededRandom::SeededRandom(uint64_t seed) : seed_(seed), engine_(seed) {}

void SeededRandom::fill(unsigned char *buf, size_t size) {
  size_t i = 0;
  while (i < size) {
    uint64_t word = engine_();
    for (size_t b = 0; b < sizeof(word) && i < size; ++b, ++i) {
      buf[i] = static_cast<unsigned char>(word >> (8 * b));
    }
  }
}

size_t SeededRandom::pickIndex(size_t count) {
  if (count == 0) {
    throw std::invalid_argument("Cannot pick from an empty range");
  }
  std::uniform_int_distribution<size_t> dist(0, count - 1);
  return dist(engine_);
}

// ----- SystemRandom -----

SystemRandom::SystemRandom() {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

void SystemRandom::fill(unsigned char *buf, size_t size) {
  randombytes_buf(buf, size);
}

size_t SystemRandom::pickIndex(size_t count) {
  if (count == 0) {
    throw std::invalid_argument("Cannot pick from an empty range");
  }
  if (count > std::numeric_limits<uint32_t>::max()) {
    throw std::invalid_argument("Range too large for uniform pick");
  }
  return randombytes_uniform(static_cast<uint32_t>(count));
}

} // namespace fv
