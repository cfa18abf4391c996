#ifndef VANITYSSH_CHANNEL_HPP
#define VANITYSSH_CHANNEL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace VanitySsh {

    /**
     * @brief Bounded many-producer / single-consumer queue.
     */
    template <typename T>
    class Channel {
    public:
        explicit Channel(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

        /**
         * @brief Queues a value, blocking while the channel is full.
         *
         * Once `stop` is set the value is queued without waiting for room, so a
         * stopped producer never loses what it already made and the queue exceeds
         * its capacity by at most one value per producer.
         */
        void send(T value, const std::atomic<bool>& stop) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                while (queue_.size() >= capacity_ && !stop.load()) {
                    // stop may be set from a signal handler, which cannot notify.
                    not_full_.wait_for(lock, SEND_RECHECK_INTERVAL);
                }
                queue_.push_back(std::move(value));
            }
            not_empty_.notify_one();
        }

        /**
         * @brief Waits up to `timeout` for a value.
         * @return The oldest queued value, or std::nullopt on timeout or notify().
         */
        template <typename Rep, typename Period>
        std::optional<T> receive_for(const std::chrono::duration<Rep, Period>& timeout) {
            std::unique_lock<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                not_empty_.wait_for(lock, timeout);
            }
            return pop_locked();
        }

        std::optional<T> try_receive() {
            std::lock_guard<std::mutex> lock(mutex_);
            return pop_locked();
        }

        // Wakes up the consumer and every blocked producer.
        void notify() {
            not_empty_.notify_all();
            not_full_.notify_all();
        }

    private:
        static constexpr std::chrono::milliseconds SEND_RECHECK_INTERVAL{10};

        std::optional<T> pop_locked() {
            if (queue_.empty()) {
                return std::nullopt;
            }
            T value = std::move(queue_.front());
            queue_.pop_front();
            not_full_.notify_one();
            return value;
        }

        const size_t capacity_;
        std::mutex mutex_;
        std::condition_variable not_empty_;
        std::condition_variable not_full_;
        std::deque<T> queue_;
    };

} // namespace VanitySsh

#endif // VANITYSSH_CHANNEL_HPP
