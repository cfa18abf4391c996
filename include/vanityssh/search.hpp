#ifndef VANITYSSH_SEARCH_HPP
#define VANITYSSH_SEARCH_HPP

#include "channel.hpp"
#include "keys.hpp"
#include "matcher.hpp"
#include "openssh.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace VanitySsh {

    // Upper bound on the number of worker threads a search accepts.
    constexpr size_t MAX_THREADS = 1024;

    // Matches the workers may queue ahead of the consumer before they block.
    constexpr size_t MATCH_QUEUE_CAPACITY = 32;

    /**
     * @brief Options of a vanity key search.
     */
    struct SearchConfig {
        std::string pattern;
        bool case_sensitive = false;
        bool streaming = false;       // keep searching after the first match
        std::string comment;          // public key annotation
        std::optional<size_t> thread_count; // unset: available parallelism
        std::chrono::milliseconds progress_interval{0}; // 0: no progress reports

        /**
         * @brief Number of hardware threads, at least 1.
         */
        static size_t default_thread_count();

        /**
         * @brief The number of workers this configuration asks for.
         * @throws VanitySsh::InvalidThreadCount for 0 or more than MAX_THREADS.
         */
        size_t resolve_thread_count() const;
    };

    /**
     * @brief A point-in-time copy of the search counters.
     */
    struct SearchStatsSnapshot {
        uint64_t attempts = 0;
        uint64_t matches = 0;
        std::chrono::steady_clock::duration elapsed{0};

        double keys_per_second() const;

        /**
         * @brief "Attempts: N | Matches: M | Duration: X.XXs | Speed: Y.YY keys/sec"
         */
        std::string to_string() const;
    };

    /**
     * @brief Counters shared by all workers. Only ever incremented.
     */
    class SearchStats {
    public:
        void start();

        // Both return the counter value after the increment.
        uint64_t add_attempt();
        uint64_t add_match();

        SearchStatsSnapshot snapshot() const;

    private:
        std::atomic<uint64_t> attempts_{0};
        std::atomic<uint64_t> matches_{0};
        std::atomic<bool> started_{false};
        std::atomic<std::chrono::steady_clock::rep> start_ticks_{0};
    };

    /**
     * @brief A key pair whose public key matched the pattern.
     */
    struct Match {
        size_t thread_index = 0;
        uint64_t attempts_at_match = 0;
        std::chrono::system_clock::time_point timestamp;
        EncodedPublicKey public_key;
        EncodedPrivateKey private_key;
    };

    enum class TerminationReason {
        FOUND_AND_STOPPED,      // non-streaming search delivered its match
        EXTERNALLY_CANCELLED,   // non-streaming search cancelled before a match
        STREAMING_STOPPED       // streaming search ended by cancel()
    };

    enum class SearchState {
        IDLE,
        RUNNING,
        STOPPED_FOUND,
        STOPPED_REQUESTED
    };

    const char* to_string(TerminationReason reason);
    const char* to_string(SearchState state);

    /**
     * @brief Runs N workers that generate Ed25519 keys until the encoded public
     * key matches a pattern, and hands every match to the caller.
     */
    class Searcher {
    public:
        using OnMatchCallback = std::function<void(const Match&, const SearchStatsSnapshot&)>;
        using OnProgressCallback = std::function<void(const SearchStatsSnapshot&)>;
        using KeyPairGenerator = std::function<RawKeyPair()>;

        explicit Searcher(SearchConfig config);

        Searcher(const Searcher&) = delete;
        Searcher& operator=(const Searcher&) = delete;

        /**
         * @brief Called from the thread running the search every progress_interval.
         */
        void set_progress_callback(OnProgressCallback callback);

        /**
         * @brief Replaces the key pair source (Crypto::generate_keypair by default).
         * The generator is called concurrently from all workers.
         */
        void set_key_generator(KeyPairGenerator generator);

        /**
         * @brief Runs the search on the calling thread until it terminates.
         *
         * on_match is invoked on the calling thread. In non-streaming mode the search
         * stops after the first match; in streaming mode it runs until cancel().
         * All workers are joined before this returns or throws.
         *
         * @throws VanitySsh::InvalidPattern before any worker is started.
         * @throws VanitySsh::InvalidThreadCount before any worker is started.
         * @throws VanitySsh::LogicError if the searcher already ran.
         * @throws The first exception raised by a worker, e.g. VanitySsh::KeyGenerationError.
         */
        TerminationReason run(OnMatchCallback on_match);

        /**
         * @brief Asks the search to stop. Async-signal-safe; callable from any thread,
         * including from on_match.
         */
        void cancel() noexcept;

        SearchState state() const;
        SearchStatsSnapshot stats() const;
        const SearchConfig& config() const;

    private:
        void worker_loop(size_t thread_index, const PatternMatcher& matcher);
        void coordinate(const OnMatchCallback& on_match);
        void deliver(const Match& match, const OnMatchCallback& on_match);
        void drain(const OnMatchCallback& on_match);
        void record_failure(std::exception_ptr error);
        void stop_and_join(std::vector<std::thread>& workers);

        SearchConfig config_;
        KeyPairGenerator generator_;
        OnProgressCallback progress_callback_;

        SearchStats stats_;
        Channel<Match> channel_{MATCH_QUEUE_CAPACITY};

        std::atomic<bool> started_{false};
        std::atomic<bool> stop_{false};
        std::atomic<bool> cancel_requested_{false};
        std::atomic<SearchState> state_{SearchState::IDLE};
        bool found_ = false;

        std::mutex failure_mutex_;
        std::exception_ptr failure_;
    };

    /**
     * @brief One-shot search with a fresh Searcher.
     */
    TerminationReason search(const SearchConfig& config, Searcher::OnMatchCallback on_match);

} // namespace VanitySsh

#endif // VANITYSSH_SEARCH_HPP
