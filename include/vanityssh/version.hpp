#ifndef VANITYSSH_VERSION_HPP
#define VANITYSSH_VERSION_HPP

#include <cstdint>
#include <string>

namespace VanitySsh {

    // Library version is represented as a 16-bit integer.
    // For example, version 1.0 is 0x0100, 1.1 is 0x0101.
    using Version = uint16_t;

    namespace Versions {
        constexpr Version V1_0 = 0x0100;
        constexpr Version CURRENT = V1_0;
    }

    /**
     * @brief Formats a version as "major.minor".
     */
    std::string version_string(Version version = Versions::CURRENT);

}  // namespace VanitySsh

#endif  // VANITYSSH_VERSION_HPP
