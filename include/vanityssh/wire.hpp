#ifndef VANITYSSH_WIRE_HPP
#define VANITYSSH_WIRE_HPP

#include <cstdint>
#include <string>
#include "keys.hpp"
#include "errors.hpp"

namespace VanitySsh {

    /**
     * @brief Builds an SSH wire-format buffer (RFC 4251 encoding).
     * Integers are big-endian, strings are prefixed by their u32 length.
     */
    class WireWriter {
    public:
        WireWriter() = default;

        WireWriter& add_u32(uint32_t value);
        WireWriter& add_bytes(const byte_vector& value);
        WireWriter& add_string(const std::string& value);
        WireWriter& add_raw(const byte_vector& value);
        WireWriter& add_raw(const std::string& value);

        size_t size() const;

        byte_vector build();

    private:
        byte_vector buffer_;
    };

    /**
     * @brief Parses an SSH wire-format buffer.
     */
    class WireReader {
    public:
        explicit WireReader(const byte_vector& data);

        /**
         * @throws VanitySsh::FormatError on every read past the end of the data.
         */
        uint32_t read_u32();
        byte_vector read_bytes();
        std::string read_string();
        byte_vector read_raw(size_t len);

        size_t remaining() const;
        bool has_more() const;

    private:
        const byte_vector& data_;
        size_t offset_ = 0;
    };

} // namespace VanitySsh

#endif // VANITYSSH_WIRE_HPP
