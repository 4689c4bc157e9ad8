#ifndef HYPRSESSION_LOGGING_HPP
#define HYPRSESSION_LOGGING_HPP

#include <source_location>
#include <string>
#include <string_view>

namespace hyprsession {

    using LogSink = void (*)(std::string_view message);

    std::string format_log_entry(std::string_view context, std::string_view message);
    std::string format_warn_entry(std::string_view context, std::string_view message);
    std::string format_debug_entry(std::string_view context, std::string_view message);
    std::string format_error_entry_with_location(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());
    std::string format_debug_entry_with_location(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

    void        set_log_sink(LogSink sink);
    void        clear_log_sink();

    void        info_log(std::string_view context, std::string_view message);
    void        warn_log(std::string_view context, std::string_view message);
    void        debug_log(bool enabled, std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());
    void        error_log(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

} // namespace hyprsession

#endif // HYPRSESSION_LOGGING_HPP
