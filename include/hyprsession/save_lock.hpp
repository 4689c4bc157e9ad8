#ifndef HYPRSESSION_SAVE_LOCK_HPP
#define HYPRSESSION_SAVE_LOCK_HPP

#include <expected>
#include <filesystem>
#include <string>

#include "hyprsession/file_descriptor.hpp"

namespace hyprsession {

    class SaveLock {
      public:
        static std::expected<SaveLock, std::string> acquire(const std::filesystem::path& path);

      private:
        explicit SaveLock(FileDescriptor fd);

        FileDescriptor fd_;
    };

} // namespace hyprsession

#endif // HYPRSESSION_SAVE_LOCK_HPP
