/**
 * @file source_rules.hpp
 * @brief Source-name validation and classification for Dim_Source
 */

#pragma once

#include <string>
#include <string_view>

namespace NewsCube {

/**
 * @brief Reject values that cannot be source names: shorter than 2 or longer
 * than 100 characters, purely numeric (row-alignment corruption), or without
 * any alphanumeric character. Expects a trimmed name.
 */
bool is_valid_source_name(std::string_view name);

/**
 * @brief News / Government / Academic / Industry / Other
 */
std::string classify_source_type(std::string_view name);

} // namespace NewsCube
