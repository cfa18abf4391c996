#include <iostream>
#include <string>
#include <vector>

#include "vanityssh/crypto.hpp"
#include "vanityssh/openssh.hpp"
#include "vanityssh/search.hpp"

constexpr size_t MATCHES_WANTED = 3;

int main() {
    // 1. Initialize the crypto library
    if (VanitySsh::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }
    std::cout << "Crypto library initialized." << std::endl;

    // 2. Configure a streaming search for keys containing "ssh" followed by a digit
    VanitySsh::SearchConfig config;
    config.pattern = "ssh[0-9]";
    config.streaming = true;
    config.comment = "example@vanityssh";
    config.thread_count = 2;

    VanitySsh::Searcher searcher(config);
    std::vector<VanitySsh::Match> matches;

    // 3. Collect matches until we have enough, then stop the search from the callback
    std::cout << "\n--- Searching ---" << std::endl;
    auto reason = searcher.run([&](const VanitySsh::Match& match, const VanitySsh::SearchStatsSnapshot& stats) {
        std::cout << "[SEARCH] thread " << match.thread_index << " found " << match.public_key.to_string() << std::endl;
        std::cout << "         " << stats.to_string() << std::endl;
        matches.push_back(match);
        if (matches.size() >= MATCHES_WANTED) {
            searcher.cancel();
        }
    });
    std::cout << "Search ended: " << VanitySsh::to_string(reason) << std::endl;

    // 4. Every private key must decode and derive the public key it was reported with
    std::cout << "\n--- Verifying ---" << std::endl;
    for (const auto& match : matches) {
        bool ok = VanitySsh::OpenSsh::verify_key_pair(match.public_key.to_string(), match.private_key.armored);
        std::cout << (ok ? "[OK]   " : "[FAIL] ") << match.public_key.body << std::endl;
        if (!ok) {
            return 1;
        }
    }

    if (!matches.empty()) {
        std::cout << "\nLast private key:\n" << matches.back().private_key.armored;
    }
    return 0;
}
