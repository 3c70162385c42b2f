#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace utility {

// trim from start (in place)
inline void ltrim(std::string &s)
{
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
                return !std::isspace(ch);
            }));
}

// trim from end (in place)
inline void rtrim(std::string &s)
{
    s.erase(std::find_if(s.rbegin(), s.rend(),
                         [](unsigned char ch) {
                             return !std::isspace(ch);
                         })
              .base(),
            s.end());
}

inline std::string trim_copy(std::string s)
{
    rtrim(s);
    ltrim(s);
    return s;
}

inline std::string to_lower_copy(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return s;
}

[[nodiscard]]
inline bool starts_with(std::string_view str, std::string_view prefix)
{
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

[[nodiscard]]
inline bool contains(std::string_view str, std::string_view what)
{
    return str.find(what) != std::string_view::npos;
}

} // namespace utility
