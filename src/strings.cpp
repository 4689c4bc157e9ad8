#include "hyprsession/strings.hpp"

#include <cctype>

namespace hyprsession {

    std::string_view trim_view(std::string_view value) {
        size_t start = 0;
        while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
            ++start;
        }
        size_t end = value.size();
        while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
            --end;
        }
        return value.substr(start, end - start);
    }

    std::string trim_copy(std::string_view value) {
        return std::string(trim_view(value));
    }

    std::string to_lower_copy(std::string_view value) {
        std::string lowered;
        lowered.reserve(value.size());
        for (const char ch : value) {
            lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
        return lowered;
    }

    std::vector<std::string> split_words(std::string_view value) {
        std::vector<std::string> words;
        std::string              current;
        for (const char ch : value) {
            if (std::isspace(static_cast<unsigned char>(ch))) {
                if (!current.empty()) {
                    words.push_back(current);
                    current.clear();
                }
                continue;
            }
            current.push_back(ch);
        }
        if (!current.empty()) {
            words.push_back(std::move(current));
        }
        return words;
    }

    std::string unquote(std::string_view value) {
        const auto trimmed = trim_view(value);
        if (trimmed.size() >= 2) {
            const char first = trimmed.front();
            if ((first == '"' || first == '\'') && trimmed.back() == first) {
                return std::string(trimmed.substr(1, trimmed.size() - 2));
            }
        }
        return std::string(trimmed);
    }

}
