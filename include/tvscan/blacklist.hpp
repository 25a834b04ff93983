#ifndef TVSCAN_BLACKLIST_HPP
#define TVSCAN_BLACKLIST_HPP

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

class Blacklist {
  private:
    std::set<std::string, std::less<>> macs_;

  public:
    Blacklist() = default;
    explicit Blacklist(const std::vector<std::string>& macs);

    void add(std::string_view mac);
    bool contains(std::string_view mac) const;
    size_t size() const;
    bool empty() const;
};

Blacklist load_blacklist(const std::string& settings_path);

#endif
