#ifndef HYPRSESSION_CHANNEL_HPP
#define HYPRSESSION_CHANNEL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace hyprsession {

    template <typename T>
    class BoundedChannel {
      public:
        explicit BoundedChannel(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

        BoundedChannel(const BoundedChannel&)            = delete;
        BoundedChannel& operator=(const BoundedChannel&) = delete;

        bool push(T value, std::stop_token token = {}) {
            std::unique_lock lock(mutex_);
            if (!not_full_.wait(lock, token, [this] { return closed_ || items_.size() < capacity_; })) {
                return false;
            }
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(value));
            not_empty_.notify_one();
            return true;
        }

        std::optional<T> pop(std::stop_token token = {}) {
            std::unique_lock lock(mutex_);
            if (!not_empty_.wait(lock, token, [this] { return closed_ || !items_.empty(); })) {
                return std::nullopt;
            }
            if (items_.empty()) {
                return std::nullopt;
            }
            T value = std::move(items_.front());
            items_.pop_front();
            not_full_.notify_one();
            return value;
        }

        std::optional<T> try_pop() {
            std::lock_guard lock(mutex_);
            if (items_.empty()) {
                return std::nullopt;
            }
            T value = std::move(items_.front());
            items_.pop_front();
            not_full_.notify_one();
            return value;
        }

        void close() {
            std::lock_guard lock(mutex_);
            closed_ = true;
            not_empty_.notify_all();
            not_full_.notify_all();
        }

      private:
        const std::size_t           capacity_;
        std::mutex                  mutex_;
        std::condition_variable_any not_empty_;
        std::condition_variable_any not_full_;
        std::deque<T>               items_;
        bool                        closed_ = false;
    };

} // namespace hyprsession

#endif // HYPRSESSION_CHANNEL_HPP
