// String and naming helpers shared by the components
#include "storyflow/util.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <random>
#include <system_error>

namespace storyflow {

std::string redact_url(std::string_view url) {
  const auto scheme = url.find("://");
  if (scheme == std::string_view::npos) {
    return std::string(url);
  }
  const auto host_start = scheme + 3;
  const auto path_start = url.find('/', host_start);
  const auto authority = url.substr(host_start, path_start == std::string_view::npos
                                                    ? std::string_view::npos
                                                    : path_start - host_start);
  const auto at = authority.rfind('@');
  if (at == std::string_view::npos) {
    return std::string(url);
  }
  std::string out(url.substr(0, host_start));
  out += "***";
  out += url.substr(host_start + at);
  return out;
}

bool is_valid_branch_name(std::string_view name) {
  if (name.empty() || name.front() == '-' || name.front() == '/' || name.back() == '/' ||
      name.back() == '.') {
    return false;
  }
  if (name == "@" || name.find("..") != std::string_view::npos ||
      name.find("//") != std::string_view::npos || name.find("@{") != std::string_view::npos) {
    return false;
  }
  if (name.ends_with(".lock")) {
    return false;
  }
  return std::ranges::none_of(name, [](char c) {
    const auto u = static_cast<unsigned char>(c);
    return u < 0x20 || u == 0x7f || c == ' ' || c == '~' || c == '^' || c == ':' || c == '?' ||
           c == '*' || c == '[' || c == '\\';
  });
}

std::string random_token() {
  static constexpr std::string_view kHex = "0123456789abcdef";
  std::random_device rd;
  std::string out;
  out.reserve(8);
  for (int i = 0; i < 8; ++i) {
    out.push_back(kHex[rd() & 0xF]);
  }
  return out;
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::string to_upper(std::string_view sv) {
  std::string out(sv);
  std::ranges::transform(out, out.begin(),
                         [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

std::string to_lower(std::string_view sv) {
  std::string out(sv);
  std::ranges::transform(out, out.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::vector<std::string> split(std::string_view sv, char sep) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= sv.size()) {
    const auto pos = sv.find(sep, start);
    const auto piece = sv.substr(start, pos == std::string_view::npos ? pos : pos - start);
    if (auto t = trim(piece); !t.empty())
      out.push_back(std::move(t));
    if (pos == std::string_view::npos)
      break;
    start = pos + 1;
  }
  return out;
}

std::string join(const std::vector<std::string> &parts, std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i)
      out += sep;
    out += parts[i];
  }
  return out;
}

std::optional<long long> parse_int(std::string_view sv) {
  long long v = 0;
  const auto *first = sv.data();
  const auto *last = sv.data() + sv.size();
  const auto [ptr, ec] = std::from_chars(first, last, v);
  if (sv.empty() || ec != std::errc{} || ptr != last || v < 0) {
    return std::nullopt;
  }
  return v;
}

std::string replace_all(std::string str, std::string_view from, std::string_view to) {
  if (from.empty())
    return str;
  std::size_t pos = 0;
  while ((pos = str.find(from, pos)) != std::string::npos) {
    str.replace(pos, from.size(), to);
    pos += to.size();
  }
  return str;
}

} // namespace strutil

} // namespace storyflow
