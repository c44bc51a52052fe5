#include "internal/blocking/blocking_index.hpp"

#include <algorithm>
#include <map>
#include <numeric>

#include "internal/blocking/blocking_key.hpp"

namespace resolver::blocking {

BlockingIndex BlockingIndex::Build(const std::vector<db::model::MentionRecord>& mentions, std::string_view key_version) {
  BlockingIndex index;
  index.mentions_ = &mentions;
  index.keys_.reserve(mentions.size());
  index.comparison_names_.reserve(mentions.size());

  for (const auto& mention : mentions) {
    index.keys_.push_back(DeriveBlockingKey(mention, key_version));
    index.comparison_names_.push_back(ComparisonName(mention));
  }

  index.by_id_.resize(mentions.size());
  std::iota(index.by_id_.begin(), index.by_id_.end(), std::size_t{0});
  std::sort(index.by_id_.begin(), index.by_id_.end(),
            [&](std::size_t a, std::size_t b) { return mentions[a].mention_id < mentions[b].mention_id; });

  // walking in id order keeps block members sorted
  std::map<std::string, std::vector<std::size_t>> grouped;
  for (std::size_t i : index.by_id_) {
    grouped[index.keys_[i]].push_back(i);
  }

  index.blocks_.reserve(grouped.size());
  for (auto& [key, members] : grouped) {
    index.blocks_.push_back(Block{key, std::move(members)});
  }
  return index;
}

std::optional<std::size_t> BlockingIndex::IndexOf(std::string_view mention_id) const {
  auto it = std::lower_bound(by_id_.begin(), by_id_.end(), mention_id,
                             [&](std::size_t i, std::string_view id) { return mentions_->at(i).mention_id < id; });
  if (it == by_id_.end() || mentions_->at(*it).mention_id != mention_id) return std::nullopt;
  return *it;
}

bool BlockingIndex::IsUnblockable(std::size_t mention_index) const {
  return keys_.at(mention_index) == kUnblockableKey;
}

} // namespace resolver::blocking
