#pragma once

#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Small helpers shared by the adapters' JSON config files.
namespace config_file {

// nullopt if the file does not exist or does not hold a JSON object. Parse
// errors are logged.
std::optional<nlohmann::json> read(const std::filesystem::path& path);

// Pretty-printed, creating parent directories as needed. The file is left
// readable by its owner only.
std::expected<void, std::string> write(const std::filesystem::path& path, const nlohmann::json& j);

// String field or fallback when missing, null or not a string.
std::string string_field(const nlohmann::json& j, const char* key, const std::string& fallback = {});

} // namespace config_file
