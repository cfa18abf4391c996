#include "vanityssh/wire.hpp"
#include "vanityssh/errors.hpp"
#include <arpa/inet.h> // For htonl, ntohl
#include <algorithm>
#include <limits>

namespace VanitySsh {

// --- WireWriter ---

WireWriter& WireWriter::add_u32(uint32_t value) {
    uint32_t be_value = htonl(value);
    buffer_.insert(buffer_.end(), reinterpret_cast<uint8_t*>(&be_value), reinterpret_cast<uint8_t*>(&be_value) + sizeof(be_value));
    return *this;
}

WireWriter& WireWriter::add_bytes(const byte_vector& value) {
    if (value.size() > std::numeric_limits<uint32_t>::max()) {
        throw InvalidArgument("Field size exceeds the u32 length prefix.");
    }
    add_u32(static_cast<uint32_t>(value.size()));
    return add_raw(value);
}

WireWriter& WireWriter::add_string(const std::string& value) {
    return add_bytes(byte_vector(value.begin(), value.end()));
}

WireWriter& WireWriter::add_raw(const byte_vector& value) {
    buffer_.insert(buffer_.end(), value.begin(), value.end());
    return *this;
}

WireWriter& WireWriter::add_raw(const std::string& value) {
    buffer_.insert(buffer_.end(), value.begin(), value.end());
    return *this;
}

size_t WireWriter::size() const {
    return buffer_.size();
}

byte_vector WireWriter::build() {
    return std::move(buffer_);
}


// --- WireReader ---

WireReader::WireReader(const byte_vector& data) : data_(data) {}

uint32_t WireReader::read_u32() {
    if (offset_ + sizeof(uint32_t) > data_.size()) {
        offset_ = data_.size(); // Prevent further reads
        throw FormatError("Invalid wire data: not enough data for u32.");
    }

    uint32_t be_value;
    std::copy(data_.begin() + offset_, data_.begin() + offset_ + sizeof(uint32_t), reinterpret_cast<uint8_t*>(&be_value));
    offset_ += sizeof(uint32_t);
    return ntohl(be_value);
}

byte_vector WireReader::read_bytes() {
    uint32_t len = read_u32();
    return read_raw(len);
}

std::string WireReader::read_string() {
    byte_vector vec = read_bytes();
    return std::string(vec.begin(), vec.end());
}

byte_vector WireReader::read_raw(size_t len) {
    if (len > remaining()) {
        offset_ = data_.size(); // Prevent further reads
        throw FormatError("Invalid wire data: not enough data for field content.");
    }

    byte_vector out(data_.begin() + offset_, data_.begin() + offset_ + len);
    offset_ += len;
    return out;
}

size_t WireReader::remaining() const {
    return data_.size() - offset_;
}

bool WireReader::has_more() const {
    return offset_ < data_.size();
}

} // namespace VanitySsh
