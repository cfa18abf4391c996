#include "vanityssh/version.hpp"

namespace VanitySsh {

    std::string version_string(Version version) {
        return std::to_string(version >> 8) + "." + std::to_string(version & 0xFF);
    }

}  // namespace VanitySsh
