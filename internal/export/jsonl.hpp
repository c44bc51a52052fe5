#pragma once

#include <google/protobuf/message.h>

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "resolver/v1/records.pb.h"

namespace resolver::exporter {

// One message per line, proto field names, no insignificant whitespace.
// Throws std::runtime_error if the message cannot be rendered.
void WriteJsonLine(const google::protobuf::Message& message, std::ostream& out);

struct MentionLines {
  std::vector<resolver::v1::MentionInput> inputs;
  std::vector<std::string>                errors; // "line N: reason"
};

// Blank lines are skipped; a malformed line is reported, not fatal.
MentionLines ReadMentionLines(std::istream& in);

} // namespace resolver::exporter
