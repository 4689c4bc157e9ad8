#include <cstdio>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "hyprsession/command.hpp"
#include "hyprsession/logging.hpp"
#include "hyprsession/paths.hpp"
#include "hyprsession/runtime.hpp"

namespace {

    void stderr_sink(std::string_view message) {
        std::fprintf(stderr, "%.*s\n", static_cast<int>(message.size()), message.data());
    }

    void print_output(std::FILE* stream, const std::string& text) {
        if (text.empty()) {
            return;
        }
        std::fputs(text.c_str(), stream);
        if (text.back() != '\n') {
            std::fputc('\n', stream);
        }
    }

} // namespace

int main(int argc, char** argv) {
    using namespace hyprsession;

    set_log_sink(stderr_sink);

    const std::vector<std::string> tokens(argv + 1, argv + argc);
    const auto                     parsed = parse_command(tokens);
    if (std::holds_alternative<ParseError>(parsed)) {
        print_output(stderr, "hyprsession: " + std::get<ParseError>(parsed).message);
        print_output(stderr, usage_text());
        return 1;
    }
    const auto command = std::get<Command>(parsed);
    if (command.kind == CommandKind::kHelp) {
        print_output(stdout, usage_text());
        return 0;
    }

    const auto paths = try_resolve_paths_from_env();
    if (!paths) {
        print_output(stderr, "hyprsession: HOME is not set");
        return 1;
    }

    const RuntimeConfig runtime  = load_runtime_config(*paths);
    const auto          invoker  = make_invoker_from_env();
    ProcessHookRunner   runner;
    NotifySendNotifier  notifier(runtime.config.notifications_enabled);
    SessionServices     services(runtime, *invoker, runner);
    const DaemonEntry   entry = [&runtime, &invoker] { return run_daemon(runtime, *invoker); };

    const auto          result = run_command(runtime, command, services, notifier, entry);
    print_output(result.success ? stdout : stderr, result.output);
    return result.success ? 0 : 1;
}
