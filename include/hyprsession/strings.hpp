#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace hyprsession {

    std::string_view         trim_view(std::string_view value);
    std::string              trim_copy(std::string_view value);
    std::string              to_lower_copy(std::string_view value);
    std::vector<std::string> split_words(std::string_view value);
    std::string              unquote(std::string_view value);

}
