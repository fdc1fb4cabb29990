//
// Created by Daniel Griffiths on 11/1/25.
//

#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>

#include "constants.hpp"

namespace string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(static_cast<unsigned char>(buf[i])) != std::tolower(static_cast<unsigned char>(key[i]))) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    bool ieq(std::string_view a, std::string_view b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
    }

    bool icontains(std::string_view haystack, std::string_view needle) {
        if (needle.empty()) {
            return true;
        }
        auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                              [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
        return it != haystack.end();
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::optional<std::pair<std::string, std::string>> split_header_line(std::string_view line) {
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return std::nullopt;
        }

        std::string name = trim(std::string(line.substr(0, colon)));
        if (name.empty() || name.find(' ') != std::string::npos) {
            return std::nullopt;
        }

        return std::make_pair(std::move(name), trim(std::string(line.substr(colon + 1))));
    }

    std::optional<long> parse_long(const std::string &s) {
        const std::string trimmed = trim(s);
        if (trimmed.empty()) {
            return std::nullopt;
        }

        char *end = nullptr;
        errno = 0;
        const long value = std::strtol(trimmed.c_str(), &end, constants::BASE_10);
        if (*end != '\0' || errno == ERANGE) {
            return std::nullopt;
        }
        return value;
    }
}  // namespace string_utils
