#include "http.hpp"
#include <cctype>

namespace siphon {

namespace {

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); i++) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i])))
      return false;
  }
  return true;
}

}  // namespace

std::string header_value(const Headers& headers, std::string_view name) {
  for (const auto& h : headers) {
    if (iequals(h.first, name)) return h.second;
  }
  return {};
}

std::string url_path(std::string_view url) {
  auto end = url.find_first_of("?#");
  if (end != std::string_view::npos) url = url.substr(0, end);
  auto scheme = url.find("://");
  if (scheme != std::string_view::npos) {
    url = url.substr(scheme + 3);
    auto slash = url.find('/');
    if (slash == std::string_view::npos) return {};
    url = url.substr(slash);
  }
  return std::string(url);
}

}  // namespace siphon
