#include "hyprsession/inotify_source.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

#include "hyprsession/logging.hpp"

namespace hyprsession {

    namespace {

        constexpr std::uint32_t kWatchMask = IN_CREATE | IN_DELETE | IN_CLOSE_WRITE | IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR;

        void signal_eventfd(int fd) {
            const std::uint64_t one = 1;
            [[maybe_unused]] const auto written = ::write(fd, &one, sizeof(one));
        }

    } // namespace

    std::optional<RawChangeKind> raw_change_kind_for_mask(std::uint32_t mask) {
        if (mask & IN_CREATE) {
            return RawChangeKind::kCreate;
        }
        if (mask & IN_DELETE) {
            return RawChangeKind::kDelete;
        }
        if (mask & (IN_MODIFY | IN_CLOSE_WRITE)) {
            return RawChangeKind::kModify;
        }
        if (mask & (IN_MOVED_FROM | IN_MOVED_TO)) {
            return RawChangeKind::kMove;
        }
        return std::nullopt;
    }

    InotifyWatchSource::InotifyWatchSource(std::filesystem::path root, int depth) : root_(std::move(root)), depth_(depth < 1 ? 1 : depth) {}

    bool InotifyWatchSource::add_directory(const std::filesystem::path& directory, int level, std::string* error) {
        const int wd = ::inotify_add_watch(inotify_.get(), directory.c_str(), kWatchMask);
        if (wd < 0) {
            if (error) {
                *error = "inotify_add_watch " + directory.string() + ": " + std::strerror(errno);
            }
            return false;
        }
        watches_[wd] = WatchedDirectory{.path = directory, .level = level};
        if (level == 0) {
            root_watch_ = wd;
        }
        return true;
    }

    bool InotifyWatchSource::add_tree(const std::filesystem::path& directory, int level, std::string* error) {
        if (!add_directory(directory, level, error)) {
            return false;
        }
        if (level + 1 >= depth_) {
            return true;
        }
        std::error_code ec;
        for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (!it->is_directory(type_ec) || it->is_symlink(type_ec)) {
                continue;
            }
            std::string nested_error;
            if (!add_tree(it->path(), level + 1, &nested_error)) {
                warn_log("watch", nested_error);
            }
        }
        return true;
    }

    std::optional<std::string> InotifyWatchSource::run(std::stop_token token, const EventEmitter& emit) {
        inotify_.reset(::inotify_init1(IN_NONBLOCK | IN_CLOEXEC));
        if (!inotify_) {
            return std::string("inotify_init1: ") + std::strerror(errno);
        }
        FileDescriptor wake(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC));
        if (!wake) {
            return std::string("eventfd: ") + std::strerror(errno);
        }
        watches_.clear();
        root_watch_ = -1;
        std::string error;
        if (!add_tree(root_, 0, &error)) {
            return error;
        }

        std::stop_callback on_stop(token, [fd = wake.get()] { signal_eventfd(fd); });
        std::array<pollfd, 2> fds{pollfd{.fd = inotify_.get(), .events = POLLIN, .revents = 0}, pollfd{.fd = wake.get(), .events = POLLIN, .revents = 0}};
        while (!token.stop_requested()) {
            const int ready = ::poll(fds.data(), fds.size(), -1);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return std::string("poll: ") + std::strerror(errno);
            }
            if (fds[1].revents != 0 || token.stop_requested()) {
                break;
            }
            if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
                return "inotify descriptor failed";
            }
            if (fds[0].revents & POLLIN) {
                if (auto failure = drain(emit)) {
                    return failure;
                }
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> InotifyWatchSource::drain(const EventEmitter& emit) {
        alignas(inotify_event) std::array<char, 16 * 1024> buffer{};
        while (true) {
            const auto length = ::read(inotify_.get(), buffer.data(), buffer.size());
            if (length < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    return std::nullopt;
                }
                return std::string("read inotify: ") + std::strerror(errno);
            }
            if (length == 0) {
                return std::nullopt;
            }
            for (std::size_t offset = 0; offset < static_cast<std::size_t>(length);) {
                const auto* event = reinterpret_cast<const inotify_event*>(buffer.data() + offset);
                offset += sizeof(inotify_event) + event->len;

                if (event->mask & IN_Q_OVERFLOW) {
                    warn_log("watch", "event queue overflow under " + root_.string());
                    continue;
                }
                const auto watched = watches_.find(event->wd);
                if (watched == watches_.end()) {
                    continue;
                }
                if (event->mask & IN_IGNORED) {
                    const bool root_gone = event->wd == root_watch_;
                    watches_.erase(watched);
                    if (root_gone) {
                        return "watched directory removed: " + root_.string();
                    }
                    continue;
                }
                if (event->mask & (IN_DELETE_SELF | IN_MOVE_SELF)) {
                    if (event->wd == root_watch_) {
                        return "watched directory removed: " + root_.string();
                    }
                    continue;
                }
                if (event->len == 0) {
                    continue;
                }
                const auto path  = watched->second.path / event->name;
                const int  level = watched->second.level;
                if ((event->mask & IN_ISDIR) && (event->mask & (IN_CREATE | IN_MOVED_TO)) && level + 1 < depth_) {
                    std::string error;
                    if (!add_tree(path, level + 1, &error)) {
                        warn_log("watch", error);
                    }
                }
                if (const auto kind = raw_change_kind_for_mask(event->mask)) {
                    emit(ChangeEvent{.path = path.string(), .kind = *kind});
                }
            }
        }
    }

    WatchSourceFactory inotify_source_factory() {
        return [](const std::filesystem::path& directory, int depth) -> std::unique_ptr<WatchSource> { return std::make_unique<InotifyWatchSource>(directory, depth); };
    }

} // namespace hyprsession
