#pragma once

#include <spdlog/fmt/fmt.h>

#include <boost/algorithm/string.hpp>
#include <list>
#include <string>
#include <string_view>

namespace util {

/**
 * Expand a host list expression into host names.
 * "cn[01-03,7]" -> cn01, cn02, cn03, cn7. Several bracket groups may appear
 * in one expression ("r[1-2]n[1-2]"). A name without brackets is returned as
 * it is.
 * @return false if a bracket group is malformed.
 */
bool ParseHostList(const std::string &host_str,
                   std::list<std::string> *hostlist);

/**
 * The inverse of ParseHostList() for names ending with a number:
 * node-1, node-2, node-3, x -> x,node-[1-3]
 */
std::string HostNameListToStr(const std::list<std::string> &hostlist);

// Lower-cased, whitespace-trimmed copy. Used to match user supplied names.
std::string CanonicalName(std::string_view name);

}  // namespace util
