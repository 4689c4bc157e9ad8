#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace hyprsession {

    std::optional<std::string>    optional_string(const nlohmann::json& value);
    std::optional<std::string>    optional_string_field(const nlohmann::json& obj, const char* key);
    std::optional<int>            optional_int_field(const nlohmann::json& obj, const char* key);
    std::optional<bool>           optional_bool_field(const nlohmann::json& obj, const char* key);

    std::optional<nlohmann::json> read_json_file(const std::filesystem::path& path, std::string* error);
    bool                          write_file_atomic(const std::filesystem::path& path, std::string_view contents, std::string* error);
    bool                          write_json_file_atomic(const std::filesystem::path& path, const nlohmann::json& value, std::string* error);

}
