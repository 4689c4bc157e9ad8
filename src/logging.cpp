#include "hyprsession/logging.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace hyprsession {

    namespace {

        std::atomic<LogSink> log_sink = nullptr;
        std::mutex           sink_mutex;

        std::string_view     basename(std::string_view path) {
            const auto slash = path.find_last_of("/\\");
            if (slash == std::string_view::npos) {
                return path;
            }
            return path.substr(slash + 1);
        }

        std::string format_entry(std::string_view prefix, std::string_view context, std::string_view message) {
            std::string text;
            text.reserve(prefix.size() + context.size() + message.size() + 8);
            text.append(prefix);
            text.push_back(' ');
            if (!context.empty()) {
                text.append(context);
                text.append(": ");
            }
            text.append(message);
            return text;
        }

        std::string format_entry_with_location(std::string_view prefix, std::string_view context, std::string_view message, const std::source_location& location) {
            auto                   text = format_entry(prefix, context, message);
            const std::string_view file = basename(location.file_name());
            text.append(" @");
            text.append(file);
            text.push_back(':');
            text.append(std::to_string(location.line()));
            const std::string_view function = location.function_name();
            if (!function.empty()) {
                text.push_back(' ');
                text.append(function);
            }
            return text;
        }

        void emit(const std::string& text) {
            const auto sink = log_sink.load();
            if (!sink) {
                return;
            }
            std::lock_guard lock(sink_mutex);
            sink(text);
        }

    } // namespace

    std::string format_log_entry(std::string_view context, std::string_view message) {
        return format_entry("[hyprsession]", context, message);
    }

    std::string format_warn_entry(std::string_view context, std::string_view message) {
        return format_entry("[hyprsession][warn]", context, message);
    }

    std::string format_debug_entry(std::string_view context, std::string_view message) {
        return format_entry("[hyprsession][debug]", context, message);
    }

    std::string format_error_entry_with_location(std::string_view context, std::string_view message, const std::source_location& location) {
        return format_entry_with_location("[hyprsession][error]", context, message, location);
    }

    std::string format_debug_entry_with_location(std::string_view context, std::string_view message, const std::source_location& location) {
        return format_entry_with_location("[hyprsession][debug]", context, message, location);
    }

    void set_log_sink(LogSink sink) {
        log_sink = sink;
    }

    void clear_log_sink() {
        log_sink = nullptr;
    }

    void info_log(std::string_view context, std::string_view message) {
        if (!log_sink.load()) {
            return;
        }
        emit(format_log_entry(context, message));
    }

    void warn_log(std::string_view context, std::string_view message) {
        if (!log_sink.load()) {
            return;
        }
        emit(format_warn_entry(context, message));
    }

    void debug_log(bool enabled, std::string_view context, std::string_view message, const std::source_location& location) {
        if (!enabled || !log_sink.load()) {
            return;
        }
        emit(format_debug_entry_with_location(context, message, location));
    }

    void error_log(std::string_view context, std::string_view message, const std::source_location& location) {
        if (!log_sink.load()) {
            return;
        }
        emit(format_error_entry_with_location(context, message, location));
    }

} // namespace hyprsession
