#include "internal/pipeline/run_report.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace resolver::pipeline {

void RunReport::Count(std::string_view key, std::uint64_t n) {
  auto it = counts_.find(key);
  if (it == counts_.end()) {
    counts_.emplace(std::string(key), n);
  } else {
    it->second += n;
  }
}

void RunReport::Example(std::string_view category, std::string detail) {
  auto it = examples_per_category_.find(category);
  if (it == examples_per_category_.end()) {
    it = examples_per_category_.emplace(std::string(category), 0).first;
  }
  if (it->second >= kMaxExamplesPerCategory) return;
  ++it->second;
  examples_.emplace_back(std::string(category), std::move(detail));
}

std::uint64_t RunReport::CountOf(std::string_view key) const {
  auto it = counts_.find(key);
  return it == counts_.end() ? 0 : it->second;
}

resolver::v1::RunReport RunReport::ToProto() const {
  resolver::v1::RunReport out;
  out.set_run_id(run_id_);
  out.set_status(status_);
  out.set_error(error_);
  for (const auto& [key, value] : counts_) {
    (*out.mutable_counts())[key] = value;
  }
  for (const auto& [category, detail] : examples_) {
    auto* example = out.add_examples();
    example->set_category(category);
    example->set_detail(detail);
  }
  return out;
}

std::string RunReport::ToJson() const {
  std::string                                json;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  auto status                        = google::protobuf::util::MessageToJsonString(ToProto(), &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to render run report: " + status.ToString());
  }
  return json;
}

RunReport RunReport::FromJson(const std::string& json) {
  resolver::v1::RunReport proto;
  auto                    status = google::protobuf::util::JsonStringToMessage(json, &proto);
  if (!status.ok()) {
    throw std::runtime_error("failed to parse run report: " + status.ToString());
  }

  RunReport report(proto.run_id());
  report.SetStatus(proto.status());
  report.SetError(proto.error());
  for (const auto& [key, value] : proto.counts()) {
    report.Count(key, value);
  }
  for (const auto& example : proto.examples()) {
    report.Example(example.category(), example.detail());
  }
  return report;
}

} // namespace resolver::pipeline
