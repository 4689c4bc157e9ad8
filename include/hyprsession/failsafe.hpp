#ifndef HYPRSESSION_FAILSAFE_HPP
#define HYPRSESSION_FAILSAFE_HPP

#include <exception>
#include <string_view>
#include <utility>

namespace hyprsession::failsafe {

    template <typename F, typename OnError>
    [[nodiscard]] bool guard(F&& fn, OnError&& on_error, std::string_view context) noexcept {
        try {
            std::forward<F>(fn)();
            return true;
        } catch (const std::exception& ex) {
            std::forward<OnError>(on_error)(context, ex.what());
        } catch (...) {
            std::forward<OnError>(on_error)(context, "unknown exception");
        }
        return false;
    }

} // namespace hyprsession::failsafe

#endif // HYPRSESSION_FAILSAFE_HPP
