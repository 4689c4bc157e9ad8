#ifndef HYPRSESSION_COMMAND_HPP
#define HYPRSESSION_COMMAND_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hyprsession {

    enum class CommandKind {
        kSave,
        kRestore,
        kStatus,
        kClean,
        kDaemonStart,
        kDaemonStop,
        kDaemonStatus,
        kDaemonRestart,
        kDaemonRun,
        kHelp,
    };

    struct Command {
        CommandKind kind;
        bool        json  = false;
        bool        force = false;
    };

    struct ParseError {
        std::string message;
    };

    std::variant<Command, ParseError> parse_command(const std::vector<std::string>& tokens);
    std::variant<Command, ParseError> parse_command(std::string_view args);
    std::string                       usage_text();

} // namespace hyprsession

#endif // HYPRSESSION_COMMAND_HPP
