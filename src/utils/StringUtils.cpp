#include "utils/StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace GossamerUtils {
    std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        size_t start = s.find_first_not_of(ws);
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(ws);
        return s.substr(start, end - start + 1);
    }

    std::vector<std::string> split(const std::string& s, char delimiter) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (start <= s.size()) {
            size_t pos = s.find(delimiter, start);
            if (pos == std::string::npos) pos = s.size();
            std::string part = trim(s.substr(start, pos - start));
            if (!part.empty()) parts.push_back(part);
            start = pos + 1;
        }
        return parts;
    }

    unsigned long long parseUnsigned(const std::string& s, unsigned long long max, const std::string& what) {
        std::string t = trim(s);
        if (t.empty() || !std::all_of(t.begin(), t.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw std::runtime_error(what + " must be a non-negative integer, got '" + s + "'");
        }
        // Túlcsordulás: stoull out_of_range-et dob
        unsigned long long value = 0;
        try {
            value = std::stoull(t);
        } catch (const std::out_of_range&) {
            throw std::runtime_error(what + " is out of range: " + s);
        }
        if (value > max) {
            throw std::runtime_error(what + " must be at most " + std::to_string(max) + ", got " + t);
        }
        return value;
    }

    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }
}
