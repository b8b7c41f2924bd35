#include "value_parsers.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <limits>

#include "raw_config.h"

namespace rivulet::config::detail {

bool parse_int32(const std::string& value, int& out) {
    const std::string cleaned = sanitize_string_value(value);
    try {
        std::size_t processed = 0;
        const long long parsed = std::stoll(cleaned, &processed, 10);
        if (processed != cleaned.size()) {
            return false;
        }
        if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
            return false;
        }
        out = static_cast<int>(parsed);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_uint64(const std::string& value, std::uint64_t& out) {
    const std::string cleaned = sanitize_string_value(value);
    if (cleaned.empty() || cleaned.front() == '-') {
        return false;
    }
    try {
        std::size_t processed = 0;
        const unsigned long long parsed = std::stoull(cleaned, &processed, 0);
        if (processed != cleaned.size()) {
            return false;
        }
        out = static_cast<std::uint64_t>(parsed);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_double(const std::string& value, double& out) {
    const std::string cleaned = sanitize_string_value(value);
    try {
        std::size_t processed = 0;
        const double parsed = std::stod(cleaned, &processed);
        if (processed != cleaned.size() || !std::isfinite(parsed)) {
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_bool(const std::string& value, bool& out) {
    std::string cleaned = sanitize_string_value(value);
    std::transform(cleaned.begin(), cleaned.end(), cleaned.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (cleaned == "true" || cleaned == "1" || cleaned == "yes" || cleaned == "on") {
        out = true;
        return true;
    }
    if (cleaned == "false" || cleaned == "0" || cleaned == "no" || cleaned == "off") {
        out = false;
        return true;
    }
    return false;
}

} // namespace rivulet::config::detail
