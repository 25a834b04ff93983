#ifndef TVSCAN_MAC_HPP
#define TVSCAN_MAC_HPP

#include <functional>
#include <map>
#include <string>
#include <string_view>

using MacPrefixTable = std::map<std::string, std::string, std::less<>>;

constexpr size_t MAC_PREFIX_LEN = 8;

std::string canonical_mac(std::string_view mac);

std::string mac_prefix(std::string_view mac);

#endif
