#ifndef VANITYSSH_CLI_HPP
#define VANITYSSH_CLI_HPP

#include "search.hpp"

#include <string>
#include <vector>

namespace VanitySsh {

    // Interval of the progress line printed while searching.
    constexpr std::chrono::milliseconds CLI_PROGRESS_INTERVAL{500};

    struct CliOptions {
        SearchConfig config;
        bool show_help = false;
        bool show_version = false;
    };

    /**
     * @brief Parses the command line (without the program name).
     *
     * vanityssh <pattern> [--streaming] [--case-sensitive] [--comment <text>]
     *           [--threads <N>] [--help] [--version]
     *
     * @throws VanitySsh::InvalidArgument on unknown options, missing values or a missing pattern.
     * @throws VanitySsh::InvalidThreadCount if --threads is not a positive integer.
     */
    CliOptions parse_args(const std::vector<std::string>& args);

    std::string usage(const std::string& program_name);

} // namespace VanitySsh

#endif // VANITYSSH_CLI_HPP
