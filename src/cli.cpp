#include "vanityssh/cli.hpp"
#include "vanityssh/errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace VanitySsh {

namespace {

size_t parse_thread_count(const std::string& value) {
    bool all_digits = !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
    if (!all_digits || value.size() > 9) {
        throw InvalidThreadCount("--threads requires a positive integer");
    }
    size_t count = std::stoul(value);
    if (count == 0) {
        throw InvalidThreadCount("--threads requires a positive integer");
    }
    return count;
}

}  // namespace

CliOptions parse_args(const std::vector<std::string>& args) {
    CliOptions options;
    options.config.progress_interval = CLI_PROGRESS_INTERVAL;
    bool have_pattern = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--streaming") {
            options.config.streaming = true;
        } else if (arg == "--case-sensitive") {
            options.config.case_sensitive = true;
        } else if (arg == "--comment") {
            if (i + 1 >= args.size()) {
                throw InvalidArgument("--comment requires a value");
            }
            options.config.comment = args[++i];
        } else if (arg == "--threads") {
            if (i + 1 >= args.size()) {
                throw InvalidArgument("--threads requires a value");
            }
            options.config.thread_count = parse_thread_count(args[++i]);
        } else if (arg == "--help") {
            options.show_help = true;
        } else if (arg == "--version") {
            options.show_version = true;
        } else if (arg.rfind("--", 0) == 0) {
            throw InvalidArgument("Unknown option: " + arg);
        } else if (have_pattern) {
            throw InvalidArgument("Multiple patterns specified");
        } else {
            options.config.pattern = arg;
            have_pattern = true;
        }
    }

    if (!have_pattern && !options.show_help && !options.show_version) {
        throw InvalidArgument("No pattern specified");
    }
    return options;
}

std::string usage(const std::string& program_name) {
    std::ostringstream out;
    out << "VanitySSH - Generate SSH keys with custom patterns\n"
        << "\n"
        << "Usage: " << program_name << " <pattern> [OPTIONS]\n"
        << "  pattern          : ECMAScript regex to match against the base64 body of the public key\n"
        << "  --streaming      : Continue generating keys after a match is found\n"
        << "  --comment <text> : Add a comment to the SSH public key\n"
        << "  --case-sensitive : Make pattern matching case-sensitive (default is case-insensitive)\n"
        << "  --threads <N>    : Number of threads to use (default: number of CPU cores)\n"
        << "  --version        : Print the version and exit\n"
        << "  --help           : Display this help message\n";
    return out.str();
}

} // namespace VanitySsh
