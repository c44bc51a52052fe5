#include "internal/export/jsonl.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <utility>

namespace resolver::exporter {

void WriteJsonLine(const google::protobuf::Message& message, std::ostream& out) {
  std::string                              json;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to render " + message.GetTypeName() + ": " + status.ToString());
  }
  out << json << '\n';
}

MentionLines ReadMentionLines(std::istream& in) {
  MentionLines result;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

    resolver::v1::MentionInput input;
    auto                       status = google::protobuf::util::JsonStringToMessage(line, &input, options);
    if (!status.ok()) {
      result.errors.push_back("line " + std::to_string(line_no) + ": " + status.ToString());
      continue;
    }
    result.inputs.push_back(std::move(input));
  }
  return result;
}

} // namespace resolver::exporter
