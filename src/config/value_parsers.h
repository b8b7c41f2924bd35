#pragma once

#include <cstdint>
#include <string>

namespace rivulet::config::detail {

// Each parser leaves `out` untouched and returns false when the whole string is not a valid value.
bool parse_int32(const std::string& value, int& out);
bool parse_uint64(const std::string& value, std::uint64_t& out);
bool parse_double(const std::string& value, double& out);
bool parse_bool(const std::string& value, bool& out);

} // namespace rivulet::config::detail
