#include "vanityssh/matcher.hpp"
#include "vanityssh/errors.hpp"

namespace VanitySsh {

namespace {

std::regex compile(const std::string& pattern, bool case_sensitive) {
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (!case_sensitive) {
        flags |= std::regex::icase;
    }
    try {
        return std::regex(pattern, flags);
    } catch (const std::regex_error& e) {
        throw InvalidPattern("Invalid regex pattern '" + pattern + "': " + e.what());
    }
}

}  // namespace

PatternMatcher::PatternMatcher(const std::string& pattern, bool case_sensitive)
    : pattern_(pattern), case_sensitive_(case_sensitive), regex_(compile(pattern, case_sensitive)) {}

bool PatternMatcher::test(const std::string& candidate) const {
    return std::regex_search(candidate, regex_);
}

const std::string& PatternMatcher::pattern() const {
    return pattern_;
}

bool PatternMatcher::case_sensitive() const {
    return case_sensitive_;
}

} // namespace VanitySsh
