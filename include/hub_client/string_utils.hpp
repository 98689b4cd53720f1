#ifndef HUB_CLIENT_STRING_UTILS_HPP
#define HUB_CLIENT_STRING_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace hub_client {

inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// ASCII 大小写不敏感比较。
inline bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace hub_client

#endif // HUB_CLIENT_STRING_UTILS_HPP
