//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef CLUMP_STRING_UTILS_HPP
#define CLUMP_STRING_UTILS_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    bool ieq(std::string_view a, std::string_view b);

    bool icontains(std::string_view haystack, std::string_view needle);

    std::string trim(std::string s);

    std::string to_lower(std::string s);

    // "Name: value\r\n" -> {"Name", "value"}; status lines and blank lines yield nullopt
    std::optional<std::pair<std::string, std::string>> split_header_line(std::string_view line);

    std::optional<long> parse_long(const std::string& s);
}  // namespace string_utils

#endif
