#ifndef VANITYSSH_MATCHER_HPP
#define VANITYSSH_MATCHER_HPP

#include <regex>
#include <string>

namespace VanitySsh {

    /**
     * @brief A compiled vanity pattern (ECMAScript regular expression).
     *
     * Compiled once, never mutated afterwards: test() may be called concurrently
     * from any number of threads on the same instance.
     */
    class PatternMatcher {
    public:
        /**
         * @brief Compiles a pattern.
         * @param pattern The regular expression.
         * @param case_sensitive When false, letters match regardless of case.
         * @throws VanitySsh::InvalidPattern if the pattern does not compile.
         */
        PatternMatcher(const std::string& pattern, bool case_sensitive);

        /**
         * @brief Searches the candidate (the base64 body of a public key) for the pattern.
         */
        bool test(const std::string& candidate) const;

        const std::string& pattern() const;
        bool case_sensitive() const;

    private:
        std::string pattern_;
        bool case_sensitive_;
        std::regex regex_;
    };

} // namespace VanitySsh

#endif // VANITYSSH_MATCHER_HPP
