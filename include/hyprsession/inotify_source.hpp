#ifndef HYPRSESSION_INOTIFY_SOURCE_HPP
#define HYPRSESSION_INOTIFY_SOURCE_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>

#include "hyprsession/change_classifier.hpp"
#include "hyprsession/file_descriptor.hpp"

namespace hyprsession {

    using EventEmitter = std::function<void(ChangeEvent)>;

    class WatchSource {
      public:
        virtual ~WatchSource()                                                                    = default;
        virtual std::optional<std::string> run(std::stop_token token, const EventEmitter& emit) = 0;
    };

    using WatchSourceFactory = std::function<std::unique_ptr<WatchSource>(const std::filesystem::path& directory, int depth)>;

    std::optional<RawChangeKind> raw_change_kind_for_mask(std::uint32_t mask);

    class InotifyWatchSource : public WatchSource {
      public:
        InotifyWatchSource(std::filesystem::path root, int depth);

        std::optional<std::string> run(std::stop_token token, const EventEmitter& emit) override;

      private:
        struct WatchedDirectory {
            std::filesystem::path path;
            int                   level = 0;
        };

        bool                       add_tree(const std::filesystem::path& directory, int level, std::string* error);
        bool                       add_directory(const std::filesystem::path& directory, int level, std::string* error);
        std::optional<std::string> drain(const EventEmitter& emit);

        std::filesystem::path                     root_;
        int                                       depth_;
        FileDescriptor                            inotify_;
        std::unordered_map<int, WatchedDirectory> watches_;
        int                                       root_watch_ = -1;
    };

    WatchSourceFactory inotify_source_factory();

} // namespace hyprsession

#endif // HYPRSESSION_INOTIFY_SOURCE_HPP
