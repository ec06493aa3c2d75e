/**
 * @file json_io.cpp
 * @brief Reading JSON documents from disk
 */

#include "typeguard/json_io.hpp"

#include <fstream>
#include <iterator>

namespace typeguard::common {

typeguard::Result<nlohmann::json> read_json_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected(
            Error::make(errc::kIoError, "Failed to open file for read: " + path));
    }
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(
            Error::make(errc::kParseError, "Failed to parse JSON from " + path + ": " + ex.what()));
    }
}

}  // namespace typeguard::common
