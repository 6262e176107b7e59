#pragma once

#include "../lib/Random.h"
#include <cstdint>
#include <string>

namespace fv {

/**
 * One chain entry: height, the identifier of the block it extends, and its
 * own identifier. Blocks are values and never change after construction.
 * The type does not check that the parent actually precedes it anywhere.
 */
class Block {
public:
  static constexpr const char *GENESIS_ID =
      "00000000-0000-0000-0000-000000000000";
  static constexpr size_t DEFAULT_SHORT_ID_LENGTH = 6;

  /**
   * New block with a fresh identifier
   * @param height Distance from genesis
   * @param parentId Identifier of the block it claims to extend
   * @param rng Source for the identifier
   */
  static Block create(uint64_t height, const std::string &parentId,
                      RandomSource &rng);

  /** The shared root every chain starts from, identical across runs */
  static Block genesis();

  /**
   * Copy of reference (height and identifier) re-parented onto a local tip.
   * The recorded parent is the adopter's tip, not the reference's real parent.
   */
  static Block adopt(const Block &reference, const std::string &localTipId);

  uint64_t getHeight() const { return height_; }
  const std::string &getParentId() const { return parentId_; }
  const std::string &getId() const { return id_; }
  bool hasParent() const { return !parentId_.empty(); }
  bool isGenesis() const { return id_ == GENESIS_ID; }

  /** e.g. "Block(h=2, hash=3f9a1c, parent=be04d2)"; 0 keeps full ids */
  std::string toString(size_t idLength = DEFAULT_SHORT_ID_LENGTH) const;

  bool operator==(const Block &other) const {
    return height_ == other.height_ && parentId_ == other.parentId_ &&
           id_ == other.id_;
  }
  bool operator!=(const Block &other) const { return !(*this == other); }

private:
  Block(uint64_t height, const std::string &parentId, const std::string &id);

  uint64_t height_;
  std::string parentId_; // empty for genesis
  std::string id_;
};

/** First length characters of id, or all of it when length is 0 */
std::string shortId(const std::string &id, size_t length);

} // namespace fv
