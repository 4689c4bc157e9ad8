#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hyprsession {

    struct ConfigValueView {
        std::string_view key;
        std::string      raw;
    };

    std::optional<int>                      read_positive_int_value(const ConfigValueView& view);
    std::optional<int>                      read_non_negative_int_value(const ConfigValueView& view);
    std::optional<bool>                     read_bool_value(const ConfigValueView& view);
    std::optional<std::vector<std::string>> read_list_value(const ConfigValueView& view);

} // namespace hyprsession
