#include "Block.h"

#include <sstream>

namespace fv {

Block::Block(uint64_t height, const std::string &parentId,
             const std::string &id)
    : height_(height), parentId_(parentId), id_(id) {}

Block Block::create(uint64_t height, const std::string &parentId,
                    RandomSource &rng) {
  return Block(height, parentId, rng.newIdentifier());
}

Block Block::genesis() { return Block(0, "", GENESIS_ID); }

Block Block::adopt(const Block &reference, const std::string &localTipId) {
  return Block(reference.height_, localTipId, reference.id_);
}

std::string Block::toString(size_t idLength) const {
  std::ostringstream oss;
  oss << "Block(h=" << height_ << ", hash=" << shortId(id_, idLength)
      << ", parent=" << (hasParent() ? shortId(parentId_, idLength) : "None")
      << ")";
  return oss.str();
}

std::string shortId(const std::string &id, size_t length) {
  if (length == 0 || length >= id.size()) {
    return id;
  }
  return id.substr(0, length);
}

} // namespace fv
