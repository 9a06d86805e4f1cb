#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace siphon {

enum class DecodeType { Unknown = 0, Json = 1 };

std::string_view decode_type_name(DecodeType t);

// One candidate of an Accept-style header, e.g. "application/json;q=0.8".
struct MediaRange {
  std::string type;
  std::string subtype;
  double q = 1.0;
  std::vector<std::pair<std::string, std::string>> params;  // excludes q
};

// Parses and orders candidates by priority: q descending, then specificity
// (concrete type, concrete subtype, parameter count), then header order.
// Malformed and q=0 candidates are dropped.
std::vector<MediaRange> parse_accept(std::string_view header);

bool is_json(const MediaRange& range);

// Empty header accepts JSON. Otherwise the highest priority candidate that
// matches a supported decoder wins; no match is Unknown.
DecodeType best_fit_decode_type(std::string_view header);

}  // namespace siphon
