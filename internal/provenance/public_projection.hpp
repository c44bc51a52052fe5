#pragma once

#include <vector>

#include "internal/db/model/entity_record.hpp"
#include "internal/db/model/mention_record.hpp"
#include "resolver/v1/records.pb.h"

namespace resolver::provenance {

/*
  Public-safe view of a committed partition.

  Includes an entity only if it is not suppressed and it is not a
  singleton below public_disclosure_floor. Mentions carry their source
  reference and source system; raw names of members are never exposed,
  only the canonical name.

  Inputs are in repository order (entities by id, memberships by
  (entity_id, mention_id), mentions by id); output is by entity_id.
*/
std::vector<resolver::v1::PublicEntity> BuildPublicProjection(const std::vector<db::model::EntityRecord>&        entities,
                                                               const std::vector<db::model::EntityMentionRecord>& memberships,
                                                               const std::vector<db::model::MentionRecord>&       mentions,
                                                               double public_disclosure_floor);

} // namespace resolver::provenance
