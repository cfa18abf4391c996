#include <atomic>
#include <csignal>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "vanityssh/cli.hpp"
#include "vanityssh/crypto.hpp"
#include "vanityssh/errors.hpp"
#include "vanityssh/search.hpp"
#include "vanityssh/version.hpp"

namespace {

std::atomic<VanitySsh::Searcher*> g_searcher{nullptr};
static_assert(std::atomic<VanitySsh::Searcher*>::is_always_lock_free, "signal handler needs a lock-free pointer");

extern "C" void handle_stop_signal(int) {
    if (VanitySsh::Searcher* searcher = g_searcher.load()) {
        searcher->cancel();
    }
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

void print_match(const VanitySsh::Match& match, const VanitySsh::SearchStatsSnapshot& stats) {
    std::cerr << "\r" << std::string(100, ' ') << "\r";
    std::cout << "\n[" << format_timestamp(match.timestamp) << "] Match found after " << match.attempts_at_match
              << " attempts (thread " << match.thread_index << ")!" << std::endl;
    std::cout << "Public Key:  " << match.public_key.to_string() << std::endl;
    std::cout << "Private Key:\n" << match.private_key.armored;
    std::cout << "Performance: " << stats.to_string() << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string program_name = argc > 0 ? argv[0] : "vanityssh";
    std::vector<std::string> args(argv + 1, argv + argc);

    VanitySsh::CliOptions options;
    try {
        options = VanitySsh::parse_args(args);
    } catch (const VanitySsh::InvalidArgument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << VanitySsh::usage(program_name);
        return 1;
    }

    if (options.show_help) {
        std::cout << VanitySsh::usage(program_name);
        return 0;
    }
    if (options.show_version) {
        std::cout << "vanityssh " << VanitySsh::version_string() << std::endl;
        return 0;
    }

    if (VanitySsh::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }

    VanitySsh::Searcher searcher(options.config);
    searcher.set_progress_callback([](const VanitySsh::SearchStatsSnapshot& stats) {
        std::cerr << "\r[PROGRESS] " << stats.to_string() << std::flush;
    });

    g_searcher.store(&searcher);
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    int exit_code = 0;
    try {
        size_t thread_count = options.config.resolve_thread_count();
        size_t cpu_count = VanitySsh::SearchConfig::default_thread_count();
        std::cout << "Using " << thread_count << " thread" << (thread_count == 1 ? "" : "s") << " (system has "
                  << cpu_count << " CPU" << (cpu_count == 1 ? "" : "s") << ")" << std::endl;
        std::cout << "Searching for pattern '" << options.config.pattern << "'"
                  << (options.config.case_sensitive ? " (case-sensitive)" : "")
                  << (options.config.streaming ? " in streaming mode, Ctrl-C to stop" : "") << std::endl;

        VanitySsh::TerminationReason reason = searcher.run(print_match);

        std::cerr << "\r" << std::string(100, ' ') << "\r";
        std::cout << "\nSearch " << VanitySsh::to_string(reason) << "." << std::endl;
        std::cout << "Final performance metrics:\n" << searcher.stats().to_string() << std::endl;
        if (reason == VanitySsh::TerminationReason::EXTERNALLY_CANCELLED) {
            exit_code = 130;
        }
    } catch (const VanitySsh::InvalidArgument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    } catch (const std::exception& e) {
        std::cerr << "Search failed: " << e.what() << std::endl;
        exit_code = 1;
    }

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_searcher.store(nullptr);
    return exit_code;
}
