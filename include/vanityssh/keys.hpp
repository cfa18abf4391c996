#ifndef VANITYSSH_KEYS_HPP
#define VANITYSSH_KEYS_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace VanitySsh {

    // Using a simple vector of bytes for data representation.
    using byte_vector = std::vector<uint8_t>;

    constexpr size_t SEED_BYTES = 32;
    constexpr size_t PUBLIC_KEY_BYTES = 32;
    // OpenSSH stores the Ed25519 secret as seed || public key.
    constexpr size_t SECRET_KEY_BYTES = SEED_BYTES + PUBLIC_KEY_BYTES;

    // The 32-byte secret seed an Ed25519 key pair is derived from.
    struct Seed {
        byte_vector data;
    };

    // An Ed25519 public key.
    struct PublicKey {
        byte_vector data;
    };

    // A seed together with the public key derived from it.
    struct RawKeyPair {
        Seed seed;
        PublicKey publicKey;
    };

} // namespace VanitySsh

#endif // VANITYSSH_KEYS_HPP
