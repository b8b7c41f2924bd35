#include "config_reader.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

#include "value_parsers.h"

namespace rivulet::config::detail {
namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

bool has_prefix(const std::string& key, const std::string& prefix) {
    return key.size() > prefix.size() && key.compare(0, prefix.size(), prefix) == 0 &&
           key[prefix.size()] == '.';
}

} // namespace

ConfigReader::ConfigReader(const RawConfig& raw, std::vector<std::string>& warnings)
    : raw_(raw)
    , warnings_(warnings) {}

const RawScalar* ConfigReader::find(const std::string& key) {
    const auto it = raw_.scalars.find(key);
    if (it == raw_.scalars.end()) {
        return nullptr;
    }
    consumed_.insert(key);
    return &it->second;
}

void ConfigReader::warn_invalid(const std::string& key, const RawScalar& scalar, const char* expected) {
    std::ostringstream oss;
    oss << "Invalid value '" << scalar.value << "' for '" << key << "' at line " << scalar.line
        << " (expected " << expected << "); keeping default";
    warnings_.push_back(oss.str());
}

bool ConfigReader::read_int(const std::string& key, int& out) {
    const RawScalar* scalar = find(key);
    if (!scalar) {
        return false;
    }
    if (!parse_int32(scalar->value, out)) {
        warn_invalid(key, *scalar, "an integer");
        return false;
    }
    return true;
}

bool ConfigReader::read_uint64(const std::string& key, std::uint64_t& out) {
    const RawScalar* scalar = find(key);
    if (!scalar) {
        return false;
    }
    if (!parse_uint64(scalar->value, out)) {
        warn_invalid(key, *scalar, "a non-negative integer");
        return false;
    }
    return true;
}

bool ConfigReader::read_double(const std::string& key, double& out) {
    const RawScalar* scalar = find(key);
    if (!scalar) {
        return false;
    }
    if (!parse_double(scalar->value, out)) {
        warn_invalid(key, *scalar, "a finite number");
        return false;
    }
    return true;
}

bool ConfigReader::read_bool(const std::string& key, bool& out) {
    const RawScalar* scalar = find(key);
    if (!scalar) {
        return false;
    }
    if (!parse_bool(scalar->value, out)) {
        warn_invalid(key, *scalar, "true or false");
        return false;
    }
    return true;
}

bool ConfigReader::read_string(const std::string& key, std::string& out) {
    const RawScalar* scalar = find(key);
    if (!scalar) {
        return false;
    }
    out = sanitize_string_value(scalar->value);
    return true;
}

bool ConfigReader::read_distribution(const std::string& prefix, sim::Distribution& out) {
    std::string kind;
    if (!read_string(prefix + ".dist", kind)) {
        if (consume_table(prefix) > 0) {
            warnings_.push_back("Distribution '" + prefix + "' has no 'dist' entry; keeping default");
        }
        return false;
    }

    kind = to_lower(kind);
    if (kind == "normal") {
        sim::NormalDist normal;
        read_double(prefix + ".mean", normal.mean);
        read_double(prefix + ".std_dev", normal.std_dev);
        out = normal;
        return true;
    }

    if (kind == "lognormal" || kind == "log_normal") {
        double median = 0.0;
        double factor = 0.0;
        const bool has_median = read_double(prefix + ".median", median);
        const bool has_factor = read_double(prefix + ".factor", factor);
        if (has_median || has_factor) {
            if (!has_median || !has_factor) {
                warnings_.push_back("Distribution '" + prefix +
                                    "' needs both 'median' and 'factor'; keeping default");
                return false;
            }
            out = sim::log_dist(median, factor);
            return true;
        }
        sim::LogNormalDist lognormal;
        read_double(prefix + ".mean", lognormal.norm.mean);
        read_double(prefix + ".std_dev", lognormal.norm.std_dev);
        out = lognormal;
        return true;
    }

    if (kind == "exp" || kind == "exponential") {
        sim::ExpDist exponential;
        read_double(prefix + ".mean", exponential.lambda_inverse);
        read_double(prefix + ".lambda_inverse", exponential.lambda_inverse);
        double rate = 0.0;
        if (read_double(prefix + ".rate", rate)) {
            exponential.lambda_inverse = 1.0 / rate;
        }
        out = exponential;
        return true;
    }

    consume_table(prefix);
    warnings_.push_back("Unknown distribution '" + kind + "' for '" + prefix + "'; keeping default");
    return false;
}

std::size_t ConfigReader::consume_table(const std::string& prefix) {
    std::size_t count = 0;
    for (const auto& [key, scalar] : raw_.scalars) {
        if (has_prefix(key, prefix)) {
            consumed_.insert(key);
            ++count;
        }
    }
    return count;
}

void ConfigReader::report_unknown_keys() {
    std::vector<std::pair<int, std::string>> unknown;
    for (const auto& [key, scalar] : raw_.scalars) {
        if (consumed_.count(key) == 0) {
            unknown.emplace_back(scalar.line, key);
        }
    }
    for (const auto& [key, array] : raw_.arrays) {
        if (consumed_.count(key) == 0) {
            unknown.emplace_back(array.line, key);
        }
    }
    std::sort(unknown.begin(), unknown.end());
    for (const auto& [line, key] : unknown) {
        std::ostringstream oss;
        oss << "Unknown key '" << key << "' at line " << line;
        warnings_.push_back(oss.str());
    }
}

} // namespace rivulet::config::detail
