#pragma once

/**
 * @file json_io.hpp
 * @brief Reading JSON documents from disk
 */

#include "typeguard/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace typeguard::common {

/**
 * Read and parse a JSON file
 * @param path File path
 * @return Parsed document, IOError when unreadable, ParseError when malformed
 */
[[nodiscard]] typeguard::Result<nlohmann::json> read_json_file(const std::string& path);

}  // namespace typeguard::common
