#include "hyprsession/config_value.hpp"

#include <charconv>
#include <cstdint>

#include "hyprsession/strings.hpp"

namespace hyprsession {

    namespace {

        std::optional<int64_t> raw_to_int64(std::string_view raw) {
            const auto trimmed = trim_view(raw);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            int64_t    value = 0;
            const auto end   = trimmed.data() + trimmed.size();
            const auto [ptr, ec] = std::from_chars(trimmed.data(), end, value);
            if (ec != std::errc{} || ptr != end) {
                return std::nullopt;
            }
            return value;
        }

        std::optional<bool> raw_to_bool(std::string_view raw) {
            const auto lowered = to_lower_copy(trim_view(raw));
            if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
                return true;
            }
            if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
                return false;
            }
            return std::nullopt;
        }

    } // namespace

    std::optional<int> read_positive_int_value(const ConfigValueView& view) {
        const auto raw = raw_to_int64(view.raw);
        if (!raw || *raw <= 0 || *raw > INT32_MAX) {
            return std::nullopt;
        }
        return static_cast<int>(*raw);
    }

    std::optional<int> read_non_negative_int_value(const ConfigValueView& view) {
        const auto raw = raw_to_int64(view.raw);
        if (!raw || *raw < 0 || *raw > INT32_MAX) {
            return std::nullopt;
        }
        return static_cast<int>(*raw);
    }

    std::optional<bool> read_bool_value(const ConfigValueView& view) {
        return raw_to_bool(view.raw);
    }

    std::optional<std::vector<std::string>> read_list_value(const ConfigValueView& view) {
        auto words = split_words(view.raw);
        for (const auto& word : words) {
            if (word.find('"') != std::string::npos || word.find('\'') != std::string::npos) {
                return std::nullopt;
            }
        }
        return words;
    }

} // namespace hyprsession
