#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace resolver::db::sql {

/*
  Embedding column encoding shared by the sqlite and postgres backends:
  IEEE-754 binary32 values, 4 bytes each, little-endian regardless of
  host byte order. A trailing partial value is ignored.
*/

inline std::string EncodeEmbedding(const std::vector<float>& values) {
  std::string out;
  out.reserve(values.size() * 4);
  for (float v : values) {
    const auto bits = std::bit_cast<std::uint32_t>(v);
    for (int shift = 0; shift < 32; shift += 8) out.push_back(static_cast<char>((bits >> shift) & 0xFF));
  }
  return out;
}

inline std::vector<float> DecodeEmbedding(const void* data, std::size_t size) {
  const auto*        bytes = static_cast<const unsigned char*>(data);
  std::vector<float> out;
  out.reserve(size / 4);
  for (std::size_t i = 0; i + 4 <= size; i += 4) {
    std::uint32_t bits = 0;
    for (std::size_t k = 0; k < 4; ++k) bits |= static_cast<std::uint32_t>(bytes[i + k]) << (8 * k);
    out.push_back(std::bit_cast<float>(bits));
  }
  return out;
}

} // namespace resolver::db::sql
