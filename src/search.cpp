#include "vanityssh/search.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "vanityssh/crypto.hpp"
#include "vanityssh/errors.hpp"

namespace VanitySsh {

    // How often the coordinator wakes up to look at the stop flag when no
    // progress reports are requested.
    constexpr std::chrono::milliseconds STOP_POLL_INTERVAL{50};

    // --- SearchConfig ---

    size_t SearchConfig::default_thread_count() {
        return std::max<size_t>(1, std::thread::hardware_concurrency());
    }

    size_t SearchConfig::resolve_thread_count() const {
        if (!thread_count) {
            return default_thread_count();
        }
        if (*thread_count == 0) {
            throw InvalidThreadCount("Thread count must be a positive integer.");
        }
        if (*thread_count > MAX_THREADS) {
            throw InvalidThreadCount("Thread count exceeds the maximum of " + std::to_string(MAX_THREADS) + ".");
        }
        return *thread_count;
    }

    // --- Stats ---

    double SearchStatsSnapshot::keys_per_second() const {
        double seconds = std::chrono::duration<double>(elapsed).count();
        if (seconds <= 0.0) {
            return 0.0;
        }
        return static_cast<double>(attempts) / seconds;
    }

    std::string SearchStatsSnapshot::to_string() const {
        std::ostringstream out;
        out << std::fixed << std::setprecision(2);
        out << "Attempts: " << attempts << " | Matches: " << matches
            << " | Duration: " << std::chrono::duration<double>(elapsed).count() << "s"
            << " | Speed: " << keys_per_second() << " keys/sec";
        return out.str();
    }

    void SearchStats::start() {
        start_ticks_.store(std::chrono::steady_clock::now().time_since_epoch().count());
        started_.store(true);
    }

    uint64_t SearchStats::add_attempt() {
        return attempts_.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    uint64_t SearchStats::add_match() {
        return matches_.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    SearchStatsSnapshot SearchStats::snapshot() const {
        SearchStatsSnapshot snap;
        snap.attempts = attempts_.load(std::memory_order_relaxed);
        snap.matches = matches_.load(std::memory_order_relaxed);
        if (started_.load()) {
            std::chrono::steady_clock::time_point start{std::chrono::steady_clock::duration(start_ticks_.load())};
            snap.elapsed = std::chrono::steady_clock::now() - start;
        }
        return snap;
    }

    const char* to_string(TerminationReason reason) {
        switch (reason) {
            case TerminationReason::FOUND_AND_STOPPED:
                return "found";
            case TerminationReason::EXTERNALLY_CANCELLED:
                return "cancelled";
            case TerminationReason::STREAMING_STOPPED:
                return "streaming stopped";
        }
        return "unknown";
    }

    const char* to_string(SearchState state) {
        switch (state) {
            case SearchState::IDLE:
                return "idle";
            case SearchState::RUNNING:
                return "running";
            case SearchState::STOPPED_FOUND:
                return "stopped (found)";
            case SearchState::STOPPED_REQUESTED:
                return "stopped (requested)";
        }
        return "unknown";
    }

    // --- Searcher ---

    Searcher::Searcher(SearchConfig config)
        : config_(std::move(config)), generator_(&Crypto::generate_keypair) {}

    void Searcher::set_progress_callback(OnProgressCallback callback) {
        progress_callback_ = std::move(callback);
    }

    void Searcher::set_key_generator(KeyPairGenerator generator) {
        generator_ = std::move(generator);
    }

    void Searcher::cancel() noexcept {
        cancel_requested_.store(true);
        stop_.store(true);
    }

    SearchState Searcher::state() const {
        return state_.load();
    }

    SearchStatsSnapshot Searcher::stats() const {
        return stats_.snapshot();
    }

    const SearchConfig& Searcher::config() const {
        return config_;
    }

    TerminationReason Searcher::run(OnMatchCallback on_match) {
        if (started_.exchange(true)) {
            throw LogicError("A Searcher can only be run once.");
        }

        // Everything that can be rejected is checked before the first worker starts.
        const PatternMatcher matcher(config_.pattern, config_.case_sensitive);
        const size_t thread_count = config_.resolve_thread_count();
        if (!generator_) {
            throw LogicError("No key generator configured.");
        }
        if (Crypto::init() != 0) {
            throw RuntimeError("Failed to initialize crypto library.");
        }

        stats_.start();
        state_ = SearchState::RUNNING;

        std::vector<std::thread> workers;
        workers.reserve(thread_count);
        try {
            for (size_t i = 0; i < thread_count; ++i) {
                workers.emplace_back(&Searcher::worker_loop, this, i, std::cref(matcher));
            }
            coordinate(on_match);
        } catch (...) {
            // on_match threw, or a thread could not be spawned: no worker may outlive run().
            stop_and_join(workers);
            state_ = SearchState::STOPPED_REQUESTED;
            throw;
        }
        stop_and_join(workers);

        // Matches produced before every worker observed the stop flag, including
        // those queued ahead of a worker failure.
        drain(on_match);

        {
            std::lock_guard<std::mutex> lock(failure_mutex_);
            if (failure_) {
                state_ = SearchState::STOPPED_REQUESTED;
                std::rethrow_exception(failure_);
            }
        }

        if (found_) {
            state_ = SearchState::STOPPED_FOUND;
            return TerminationReason::FOUND_AND_STOPPED;
        }
        state_ = SearchState::STOPPED_REQUESTED;
        return config_.streaming ? TerminationReason::STREAMING_STOPPED : TerminationReason::EXTERNALLY_CANCELLED;
    }

    void Searcher::coordinate(const OnMatchCallback& on_match) {
        const bool reports_progress = progress_callback_ && config_.progress_interval.count() > 0;
        const auto poll_interval = reports_progress ? std::min<std::chrono::milliseconds>(config_.progress_interval, STOP_POLL_INTERVAL)
                                                    : STOP_POLL_INTERVAL;
        auto next_report = std::chrono::steady_clock::now() + config_.progress_interval;

        while (!stop_.load()) {
            std::optional<Match> match = channel_.receive_for(poll_interval);
            if (match) {
                deliver(*match, on_match);
                if (!config_.streaming) {
                    found_ = true;
                    stop_.store(true);
                    break;
                }
            }

            if (reports_progress) {
                auto now = std::chrono::steady_clock::now();
                if (now >= next_report) {
                    progress_callback_(stats_.snapshot());
                    next_report = now + config_.progress_interval;
                }
            }
        }
    }

    void Searcher::deliver(const Match& match, const OnMatchCallback& on_match) {
        stats_.add_match();
        if (on_match) {
            on_match(match, stats_.snapshot());
        }
    }

    void Searcher::drain(const OnMatchCallback& on_match) {
        while (std::optional<Match> match = channel_.try_receive()) {
            if (config_.streaming) {
                deliver(*match, on_match);
            } else if (!found_) {
                deliver(*match, on_match);
                found_ = true;
            }
            // Further non-streaming matches lost the race to the first one.
        }
    }

    void Searcher::worker_loop(size_t thread_index, const PatternMatcher& matcher) {
        try {
            while (!stop_.load(std::memory_order_relaxed)) {
                RawKeyPair key_pair = generator_();
                OpenSsh::validate_key_pair(key_pair);
                uint64_t attempt = stats_.add_attempt();

                EncodedPublicKey public_key = OpenSsh::encode_public_key(key_pair.publicKey, config_.comment);
                if (!matcher.test(public_key.body)) {
                    continue;
                }

                Match match;
                match.thread_index = thread_index;
                match.attempts_at_match = attempt;
                match.timestamp = std::chrono::system_clock::now();
                match.public_key = std::move(public_key);
                match.private_key = OpenSsh::encode_private_key(key_pair, config_.comment);
                channel_.send(std::move(match), stop_);
            }
        } catch (const std::exception& e) {
            std::cerr << "[SEARCH] Worker " << thread_index << " failed: " << e.what() << std::endl;
            record_failure(std::current_exception());
        } catch (...) {
            std::cerr << "[SEARCH] Worker " << thread_index << " failed with an unknown error" << std::endl;
            record_failure(std::current_exception());
        }
    }

    void Searcher::record_failure(std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(failure_mutex_);
            if (!failure_) {
                failure_ = error;
            }
        }
        stop_.store(true);
        channel_.notify();
    }

    void Searcher::stop_and_join(std::vector<std::thread>& workers) {
        stop_.store(true);
        channel_.notify();
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    TerminationReason search(const SearchConfig& config, Searcher::OnMatchCallback on_match) {
        Searcher searcher(config);
        return searcher.run(std::move(on_match));
    }

}  // namespace VanitySsh
