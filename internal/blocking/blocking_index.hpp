#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/mention_record.hpp"

namespace resolver::blocking {

/*
  Immutable per-run grouping of mentions by blocking key.

  Built once from the mention list (indices refer to that list, which
  must outlive the index) and then shared read-only by every worker.

  - Blocks() is ordered by key; the unblockable block "" sorts first
  - members of a block are ordered by mention_id
  - every mention appears in exactly one block
*/
class BlockingIndex {
 public:
  struct Block {
    std::string              key;
    std::vector<std::size_t> members;
  };

  // Throws util::ConfigError for an unknown key version.
  static BlockingIndex Build(const std::vector<db::model::MentionRecord>& mentions, std::string_view key_version);

  const std::vector<Block>& Blocks() const {
    return blocks_;
  }

  const std::string& KeyOf(std::size_t mention_index) const {
    return keys_.at(mention_index);
  }

  const std::string& ComparisonNameOf(std::size_t mention_index) const {
    return comparison_names_.at(mention_index);
  }

  const db::model::MentionRecord& Mention(std::size_t mention_index) const {
    return mentions_->at(mention_index);
  }

  std::size_t MentionCount() const {
    return keys_.size();
  }

  std::optional<std::size_t> IndexOf(std::string_view mention_id) const;

  bool IsUnblockable(std::size_t mention_index) const;

 private:
  const std::vector<db::model::MentionRecord>* mentions_ = nullptr;
  std::vector<std::string>                     keys_;
  std::vector<std::string>                     comparison_names_;
  std::vector<std::size_t>                     by_id_;
  std::vector<Block>                           blocks_;
};

} // namespace resolver::blocking
