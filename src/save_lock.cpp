#include "hyprsession/save_lock.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>

namespace hyprsession {

    SaveLock::SaveLock(FileDescriptor fd) : fd_(std::move(fd)) {}

    std::expected<SaveLock, std::string> SaveLock::acquire(const std::filesystem::path& path) {
        std::error_code ec;
        if (const auto parent = path.parent_path(); !parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        FileDescriptor fd(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600));
        if (!fd) {
            return std::unexpected("unable to open save lock: " + std::string(std::strerror(errno)));
        }
        while (::flock(fd.get(), LOCK_EX) < 0) {
            if (errno != EINTR) {
                return std::unexpected("unable to lock save lock: " + std::string(std::strerror(errno)));
            }
        }
        return SaveLock(std::move(fd));
    }

} // namespace hyprsession
