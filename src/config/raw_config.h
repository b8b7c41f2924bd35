#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rivulet::config::detail {

struct RawScalar {
    std::string value;
    int line = 0;
};

// No key accepts an array; only the position is kept for the unknown-key warning.
struct RawArray {
    int line = 0;
};

// A TOML document flattened into dotted keys ("forces.strength.dist").
struct RawConfig {
    std::unordered_map<std::string, RawScalar> scalars;
    std::unordered_map<std::string, RawArray> arrays;
};

// Missing files leave `loaded_file` false and return an empty RawConfig; parse errors become warnings.
RawConfig parse_raw_config(const std::string& path,
                           std::vector<std::string>& warnings,
                           bool& loaded_file);

RawConfig parse_raw_config_string(std::string_view document,
                                  std::vector<std::string>& warnings);

std::string sanitize_string_value(const std::string& value);

} // namespace rivulet::config::detail
