#include "negotiate.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace siphon {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

std::vector<std::string_view> split(std::string_view s, char sep) {
  std::vector<std::string_view> out;
  size_t start = 0;
  while (true) {
    size_t pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      out.push_back(s.substr(start));
      return out;
    }
    out.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

int specificity(const MediaRange& r) {
  int score = 0;
  if (r.type != "*") score += 4;
  if (r.subtype != "*") score += 2;
  return score;
}

}  // namespace

std::string_view decode_type_name(DecodeType t) {
  switch (t) {
    case DecodeType::Json: return "json";
    case DecodeType::Unknown: break;
  }
  return "unknown";
}

std::vector<MediaRange> parse_accept(std::string_view header) {
  std::vector<MediaRange> out;
  for (auto part : split(header, ',')) {
    auto fields = split(part, ';');
    auto media = trim(fields[0]);
    auto slash = media.find('/');
    if (media.empty() || slash == std::string_view::npos) continue;

    MediaRange r;
    r.type = lower(trim(media.substr(0, slash)));
    r.subtype = lower(trim(media.substr(slash + 1)));
    if (r.type.empty() || r.subtype.empty()) continue;
    // "*/json" names no real range.
    if (r.type == "*" && r.subtype != "*") continue;

    bool bad_q = false;
    for (size_t i = 1; i < fields.size(); ++i) {
      auto param = trim(fields[i]);
      if (param.empty()) continue;
      auto eq = param.find('=');
      std::string key = lower(trim(param.substr(0, eq)));
      std::string value = eq == std::string_view::npos ? "" : std::string(trim(param.substr(eq + 1)));
      if (key == "q") {
        char* end = nullptr;
        double q = std::strtod(value.c_str(), &end);
        if (value.empty() || *end != '\0' || q < 0.0 || q > 1.0) {
          bad_q = true;
          break;
        }
        r.q = q;
      } else {
        r.params.emplace_back(std::move(key), std::move(value));
      }
    }
    if (bad_q || r.q <= 0.0) continue;
    out.push_back(std::move(r));
  }

  std::stable_sort(out.begin(), out.end(), [](const MediaRange& a, const MediaRange& b) {
    if (a.q != b.q) return a.q > b.q;
    int sa = specificity(a), sb = specificity(b);
    if (sa != sb) return sa > sb;
    return a.params.size() > b.params.size();
  });
  return out;
}

bool is_json(const MediaRange& r) {
  if (r.type == "application") return r.subtype == "json" || r.subtype == "*";
  return r.type == "*" && r.subtype == "*";
}

DecodeType best_fit_decode_type(std::string_view header) {
  if (trim(header).empty()) return DecodeType::Json;
  for (const auto& r : parse_accept(header)) {
    if (is_json(r)) return DecodeType::Json;
  }
  return DecodeType::Unknown;
}

}  // namespace siphon
