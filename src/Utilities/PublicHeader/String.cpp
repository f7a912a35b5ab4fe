#include "podx/String.h"

#include <iomanip>
#include <map>
#include <regex>
#include <sstream>
#include <vector>

namespace util {

namespace {

// Expand the first bracket group of `expr` and recurse on the rest.
bool ExpandFirstGroup_(const std::string &expr,
                       std::list<std::string> *hostlist) {
  auto open = expr.find('[');
  if (open == std::string::npos) {
    if (expr.find(']') != std::string::npos) return false;
    hostlist->emplace_back(expr);
    return true;
  }

  auto close = expr.find(']', open);
  if (close == std::string::npos) return false;

  std::string head = expr.substr(0, open);
  std::string group = expr.substr(open + 1, close - open - 1);
  std::string tail = expr.substr(close + 1);

  std::vector<std::string> ranges;
  boost::split(ranges, group, boost::is_any_of(","));

  static const std::regex single_regex(R"(^\d+$)");
  static const std::regex range_regex(R"(^(\d+)-(\d+)$)");

  for (auto &&range : ranges) {
    std::smatch match;
    if (std::regex_match(range, single_regex)) {
      if (!ExpandFirstGroup_(fmt::format("{}{}{}", head, range, tail),
                             hostlist))
        return false;
    } else if (std::regex_match(range, match, range_regex)) {
      std::string first_str = match[1];
      uint64_t first = std::stoull(first_str);
      uint64_t last = std::stoull(match[2]);
      if (first > last) return false;

      // cn[01-10] keeps the leading zero of the lower bound.
      auto width = static_cast<int>(first_str.length());
      for (uint64_t i = first; i <= last; i++) {
        std::stringstream ss;
        ss << std::setw(width) << std::setfill('0') << i;
        if (!ExpandFirstGroup_(fmt::format("{}{}{}", head, ss.str(), tail),
                               hostlist))
          return false;
      }
    } else {
      return false;
    }
  }

  return true;
}

}  // namespace

bool ParseHostList(const std::string &host_str,
                   std::list<std::string> *hostlist) {
  std::string expr = boost::algorithm::trim_copy(host_str);
  if (expr.empty()) return false;

  std::list<std::string> expanded;
  if (!ExpandFirstGroup_(expr, &expanded)) return false;

  hostlist->splice(hostlist->end(), expanded);
  return true;
}

std::string HostNameListToStr(const std::list<std::string> &hostlist) {
  // prefix -> trailing numbers. Leading zeros of a number stay in the prefix,
  // so cn01 and cn02 fold into cn0[1-2].
  std::map<std::string, std::list<uint64_t>> prefix_num_map;
  std::vector<std::string> parts;

  static const std::regex num_regex(R"(([1-9]\d*|0)$)");

  for (const auto &host : hostlist) {
    if (host.empty()) continue;

    std::smatch match;
    if (std::regex_search(host, match, num_regex) &&
        match.position(0) > 0) {
      prefix_num_map[host.substr(0, match.position(0))].push_back(
          std::stoull(match.str(0)));
    } else {
      parts.emplace_back(host);
    }
  }

  for (auto &&[prefix, nums] : prefix_num_map) {
    nums.sort();
    nums.unique();

    if (nums.size() == 1) {
      parts.emplace_back(fmt::format("{}{}", prefix, nums.front()));
      continue;
    }

    std::vector<std::string> ranges;
    auto it = nums.begin();
    while (it != nums.end()) {
      uint64_t first = *it;
      uint64_t last = first;
      for (++it; it != nums.end() && *it == last + 1; ++it) last = *it;

      if (first == last)
        ranges.emplace_back(std::to_string(first));
      else
        ranges.emplace_back(fmt::format("{}-{}", first, last));
    }

    parts.emplace_back(
        fmt::format("{}[{}]", prefix, boost::algorithm::join(ranges, ",")));
  }

  return boost::algorithm::join(parts, ",");
}

std::string CanonicalName(std::string_view name) {
  std::string s(name);
  boost::algorithm::trim(s);
  boost::algorithm::to_lower(s);
  return s;
}

}  // namespace util
