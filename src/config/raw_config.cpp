#include "raw_config.h"

#include <cctype>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <limits>
#include <sstream>
#include <system_error>
#include <utility>

#include <toml.hpp>

namespace rivulet::config::detail {
namespace {

std::string trim(std::string_view sv) {
    std::size_t begin = 0;
    std::size_t end = sv.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(sv[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(sv[end - 1]))) {
        --end;
    }
    return std::string(sv.substr(begin, end - begin));
}

int node_line(const toml::node& node) {
    return static_cast<int>(node.source().begin.line);
}

std::string node_to_string(const toml::node& node) {
    if (auto value = node.value_exact<std::string>()) {
        return *value;
    }
    if (auto value = node.value_exact<bool>()) {
        return *value ? "true" : "false";
    }
    if (auto value = node.value_exact<std::int64_t>()) {
        return std::to_string(*value);
    }
    if (auto value = node.value_exact<double>()) {
        std::ostringstream oss;
        oss << std::setprecision(std::numeric_limits<double>::max_digits10) << *value;
        return oss.str();
    }
    std::ostringstream oss;
    oss << toml::default_formatter{node};
    return oss.str();
}

void flatten_table(const toml::table& table, const std::string& prefix, RawConfig& out) {
    for (const auto& [key, value] : table) {
        const std::string key_str{key.str()};
        const std::string full_key = prefix.empty() ? key_str : prefix + '.' + key_str;

        if (const auto* child_table = value.as_table()) {
            flatten_table(*child_table, full_key, out);
            continue;
        }
        if (const auto* array = value.as_array()) {
            out.arrays[full_key] = RawArray{static_cast<int>(array->source().begin.line)};
            continue;
        }

        RawScalar scalar;
        scalar.value = node_to_string(value);
        scalar.line = node_line(value);
        out.scalars[full_key] = std::move(scalar);
    }
}

std::string describe_parse_error(const toml::parse_error& err, std::string_view origin) {
    std::ostringstream oss;
    oss << "Failed to parse '" << origin << "': " << err.description()
        << " (line " << err.source().begin.line
        << ", column " << err.source().begin.column << ")";
    return oss.str();
}

} // namespace

RawConfig parse_raw_config(const std::string& path,
                           std::vector<std::string>& warnings,
                           bool& loaded_file) {
    RawConfig raw;
    loaded_file = false;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return raw;
    }

    try {
        const toml::table parsed = toml::parse_file(path);
        loaded_file = true;
        flatten_table(parsed, std::string{}, raw);
    } catch (const toml::parse_error& err) {
        warnings.push_back(describe_parse_error(err, path));
    }

    return raw;
}

RawConfig parse_raw_config_string(std::string_view document,
                                  std::vector<std::string>& warnings) {
    RawConfig raw;
    try {
        const toml::table parsed = toml::parse(document);
        flatten_table(parsed, std::string{}, raw);
    } catch (const toml::parse_error& err) {
        warnings.push_back(describe_parse_error(err, "<inline>"));
    }
    return raw;
}

std::string sanitize_string_value(const std::string& value) {
    std::string trimmed = trim(value);
    if (trimmed.length() >= 2) {
        const char first = trimmed.front();
        const char last = trimmed.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            trimmed = trimmed.substr(1, trimmed.length() - 2);
        }
    }
    return trimmed;
}

} // namespace rivulet::config::detail
