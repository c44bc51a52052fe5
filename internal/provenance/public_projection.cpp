#include "internal/provenance/public_projection.hpp"

#include <map>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace resolver::provenance {

std::vector<resolver::v1::PublicEntity> BuildPublicProjection(const std::vector<db::model::EntityRecord>&        entities,
                                                               const std::vector<db::model::EntityMentionRecord>& memberships,
                                                               const std::vector<db::model::MentionRecord>&       mentions,
                                                               double public_disclosure_floor) {
  std::map<std::string, const db::model::MentionRecord*> mention_by_id;
  for (const auto& m : mentions) mention_by_id[m.mention_id] = &m;

  std::map<std::string, std::vector<const db::model::MentionRecord*>> members;
  for (const auto& row : memberships) {
    auto it = mention_by_id.find(row.mention_id);
    if (it == mention_by_id.end()) {
      throw util::DataIntegrityViolation("entity " + row.entity_id + " references unknown mention " + row.mention_id);
    }
    members[row.entity_id].push_back(it->second);
  }

  std::vector<resolver::v1::PublicEntity> out;
  for (const auto& entity : entities) {
    if (entity.suppress_from_public) continue;

    const auto& member_list = members[entity.entity_id];
    if (member_list.size() <= 1 && entity.confidence < public_disclosure_floor) continue;

    resolver::v1::PublicEntity pub;
    pub.set_entity_id(entity.entity_id);
    pub.set_canonical_name(entity.canonical_name);
    pub.set_entity_type(std::string(model::ToString(entity.entity_type)));
    pub.set_is_verified(entity.is_verified);
    pub.set_confidence(entity.confidence);
    for (const auto* mention : member_list) {
      auto* pm = pub.add_mentions();
      pm->set_mention_id(mention->mention_id);
      pm->set_source_reference(mention->source_reference);
      pm->set_source_system(mention->source_system);
    }
    out.push_back(std::move(pub));
  }
  return out;
}

} // namespace resolver::provenance
