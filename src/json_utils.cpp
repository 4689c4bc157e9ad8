#include "hyprsession/json_utils.hpp"

#include <fstream>
#include <sstream>

#include <unistd.h>

namespace hyprsession {

    std::optional<std::string> optional_string(const nlohmann::json& value) {
        if (value.is_null()) {
            return std::nullopt;
        }
        if (!value.is_string()) {
            return std::nullopt;
        }
        auto str = value.get<std::string>();
        if (str.empty()) {
            return std::nullopt;
        }
        return str;
    }

    std::optional<std::string> optional_string_field(const nlohmann::json& obj, const char* key) {
        if (!obj.contains(key)) {
            return std::nullopt;
        }
        return optional_string(obj.at(key));
    }

    std::optional<int> optional_int_field(const nlohmann::json& obj, const char* key) {
        if (!obj.contains(key) || !obj.at(key).is_number_integer()) {
            return std::nullopt;
        }
        return obj.at(key).get<int>();
    }

    std::optional<bool> optional_bool_field(const nlohmann::json& obj, const char* key) {
        if (!obj.contains(key) || !obj.at(key).is_boolean()) {
            return std::nullopt;
        }
        return obj.at(key).get<bool>();
    }

    std::optional<nlohmann::json> read_json_file(const std::filesystem::path& path, std::string* error) {
        if (error) {
            error->clear();
        }
        std::ifstream input(path);
        if (!input.good()) {
            if (error) {
                *error = "unable to read " + path.string();
            }
            return std::nullopt;
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();
        auto parsed = nlohmann::json::parse(buffer.str(), nullptr, false);
        if (parsed.is_discarded()) {
            if (error) {
                *error = "invalid json in " + path.string();
            }
            return std::nullopt;
        }
        return parsed;
    }

    bool write_file_atomic(const std::filesystem::path& path, std::string_view contents, std::string* error) {
        if (error) {
            error->clear();
        }
        std::error_code ec;
        if (const auto parent = path.parent_path(); !parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                if (error) {
                    *error = "unable to create " + parent.string();
                }
                return false;
            }
        }
        auto temp_path = path;
        temp_path += ".tmp." + std::to_string(::getpid());
        {
            std::ofstream output(temp_path, std::ios::trunc);
            if (!output.good()) {
                if (error) {
                    *error = "unable to write " + temp_path.string();
                }
                return false;
            }
            output << contents;
            output.flush();
            if (!output.good()) {
                if (error) {
                    *error = "unable to write " + temp_path.string();
                }
                std::filesystem::remove(temp_path, ec);
                return false;
            }
        }
        std::filesystem::rename(temp_path, path, ec);
        if (ec) {
            if (error) {
                *error = "unable to replace " + path.string() + ": " + ec.message();
            }
            std::error_code remove_ec;
            std::filesystem::remove(temp_path, remove_ec);
            return false;
        }
        return true;
    }

    bool write_json_file_atomic(const std::filesystem::path& path, const nlohmann::json& value, std::string* error) {
        return write_file_atomic(path, value.dump(2) + "\n", error);
    }

}
