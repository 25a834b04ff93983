#include <tvscan/mac.hpp>
#include <tvscan/utils.hpp>

#include <cctype>

std::string canonical_mac(std::string_view mac) {
    std::string ret;
    auto trimmed = trim(mac);
    ret.reserve(trimmed.size());
    for (auto c : trimmed) {
        if (c == '-') {
            ret.push_back(':');
        } else {
            ret.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return ret;
}

std::string mac_prefix(std::string_view mac) {
    auto canon = canonical_mac(mac);
    if (canon.size() > MAC_PREFIX_LEN) {
        canon.resize(MAC_PREFIX_LEN);
    }
    return canon;
}
