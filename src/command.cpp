#include "hyprsession/command.hpp"

#include <cctype>

namespace hyprsession {

    namespace {

        std::optional<std::string> split_tokens(std::string_view args, std::vector<std::string>* tokens) {
            std::string current;
            bool        in_quotes = false;
            bool        escaped   = false;
            char        quote     = '\0';
            for (const char ch : args) {
                if (escaped) {
                    current.push_back(ch);
                    escaped = false;
                    continue;
                }
                if (in_quotes && ch == '\\') {
                    escaped = true;
                    continue;
                }
                if (in_quotes) {
                    if (ch == quote) {
                        in_quotes = false;
                        continue;
                    }
                    current.push_back(ch);
                    continue;
                }
                if (ch == '"' || ch == '\'') {
                    in_quotes = true;
                    quote     = ch;
                    continue;
                }
                if (std::isspace(static_cast<unsigned char>(ch))) {
                    if (!current.empty()) {
                        tokens->push_back(current);
                        current.clear();
                    }
                    continue;
                }
                current.push_back(ch);
            }
            if (escaped || in_quotes) {
                return std::string("unterminated quote");
            }
            if (!current.empty()) {
                tokens->push_back(std::move(current));
            }
            return std::nullopt;
        }

        std::variant<Command, ParseError> parse_force_option(CommandKind kind, const std::vector<std::string>& tokens, size_t first) {
            Command command{.kind = kind};
            for (size_t i = first; i < tokens.size(); ++i) {
                if (tokens[i] == "--force" || tokens[i] == "-f") {
                    command.force = true;
                    continue;
                }
                return ParseError{"unknown option " + tokens[i]};
            }
            return command;
        }

        std::variant<Command, ParseError> parse_daemon(const std::vector<std::string>& tokens) {
            if (tokens.size() < 2) {
                return ParseError{"missing daemon subcommand"};
            }
            const auto& sub = tokens[1];
            if (sub == "start") {
                return parse_force_option(CommandKind::kDaemonStart, tokens, 2);
            }
            if (sub == "restart") {
                return parse_force_option(CommandKind::kDaemonRestart, tokens, 2);
            }
            if (sub == "stop" || sub == "status" || sub == "run") {
                if (tokens.size() > 2) {
                    return ParseError{"unexpected extra arguments"};
                }
                if (sub == "stop") {
                    return Command{.kind = CommandKind::kDaemonStop};
                }
                if (sub == "status") {
                    return Command{.kind = CommandKind::kDaemonStatus};
                }
                return Command{.kind = CommandKind::kDaemonRun};
            }
            return ParseError{"unknown daemon subcommand"};
        }

    } // namespace

    std::variant<Command, ParseError> parse_command(const std::vector<std::string>& tokens) {
        if (tokens.empty()) {
            return ParseError{"missing command"};
        }

        const auto& name = tokens[0];
        if (name == "help" || name == "--help" || name == "-h") {
            return Command{.kind = CommandKind::kHelp};
        }
        if (name == "status") {
            Command command{.kind = CommandKind::kStatus};
            for (size_t i = 1; i < tokens.size(); ++i) {
                if (tokens[i] == "--json") {
                    command.json = true;
                    continue;
                }
                return ParseError{"unknown status option " + tokens[i]};
            }
            return command;
        }
        if (name == "save" || name == "restore" || name == "clean") {
            if (tokens.size() > 1) {
                return ParseError{"unexpected extra arguments"};
            }
            if (name == "save") {
                return Command{.kind = CommandKind::kSave};
            }
            if (name == "restore") {
                return Command{.kind = CommandKind::kRestore};
            }
            return Command{.kind = CommandKind::kClean};
        }
        if (name == "daemon") {
            return parse_daemon(tokens);
        }
        return ParseError{"unknown command " + name};
    }

    std::variant<Command, ParseError> parse_command(std::string_view args) {
        std::vector<std::string> tokens;
        if (const auto error = split_tokens(args, &tokens)) {
            return ParseError{*error};
        }
        return parse_command(tokens);
    }

    std::string usage_text() {
        return "usage: hyprsession <command>\n"
               "\n"
               "commands:\n"
               "  save                       capture the current session\n"
               "  restore                    restore the last saved session\n"
               "  status [--json]            show the saved session\n"
               "  clean                      remove all saved sessions\n"
               "  daemon start [--force]     start the environment monitor\n"
               "  daemon stop                stop the environment monitor\n"
               "  daemon status              show the environment monitor\n"
               "  daemon restart [--force]   restart the environment monitor\n"
               "  daemon run                 run the environment monitor in the foreground\n"
               "  help                       show this text\n";
    }

} // namespace hyprsession
