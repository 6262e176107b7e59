#ifndef FORKVOTE_RANDOM_H
#define FORKVOTE_RANDOM_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

namespace fv {

/**
 * Source of randomness for block identifiers and candidate selection.
 * Passed by reference to everything that needs it so runs can be made
 * reproducible by injecting a seeded source.
 */
class RandomSource {
public:
  virtual ~RandomSource() = default;

  /** Fill buf with size random bytes */
  virtual void fill(unsigned char *buf, size_t size) = 0;

  /**
   * Uniformly pick an index in [0, count)
   * @throws std::invalid_argument if count is 0
   */
  virtual size_t pickIndex(size_t count) = 0;

  /** Fresh identifier in UUID version 4 text form */
  std::string newIdentifier();
};

// Deterministic source for reproducible simulations and tests
class SeededRandom : public RandomSource {
public:
  explicit SeededRandom(uint64_t seed);

  void fill(unsigned char *buf, size_t size) override;
  size_t pickIndex(size_t count) override;

  uint64_t getSeed() const { return seed_; }

private:
  uint64_t seed_;
  std::mt19937_64 engine_;
};

// Non-reproducible source backed by libsodium
class SystemRandom : public RandomSource {
public:
  /** @throws std::runtime_error if libsodium cannot be initialized */
  SystemRandom();

  void fill(unsigned char *buf, size_t size) override;
  size_t pickIndex(size_t count) override;
};

} // namespace fv

#endif // FORKVOTE_RANDOM_H
