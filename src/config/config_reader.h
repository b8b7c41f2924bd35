#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "raw_config.h"
#include "sim/distribution.h"

namespace rivulet::config::detail {

// Typed access to a RawConfig. Values that fail to parse keep the caller's default and add a warning.
class ConfigReader {
public:
    ConfigReader(const RawConfig& raw, std::vector<std::string>& warnings);

    bool read_int(const std::string& key, int& out);
    bool read_uint64(const std::string& key, std::uint64_t& out);
    bool read_double(const std::string& key, double& out);
    bool read_bool(const std::string& key, bool& out);
    bool read_string(const std::string& key, std::string& out);

    // Reads the table at `prefix`: dist = "normal" | "lognormal" | "exp" plus its parameters.
    bool read_distribution(const std::string& prefix, sim::Distribution& out);

    // Adds a warning for every key nothing asked for.
    void report_unknown_keys();

private:
    const RawScalar* find(const std::string& key);
    // Marks every scalar under `prefix.` as read; returns how many there were.
    std::size_t consume_table(const std::string& prefix);
    void warn_invalid(const std::string& key, const RawScalar& scalar, const char* expected);

    const RawConfig& raw_;
    std::vector<std::string>& warnings_;
    std::set<std::string> consumed_;
};

} // namespace rivulet::config::detail
