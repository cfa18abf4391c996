#ifndef VANITYSSH_CRYPTO_HPP
#define VANITYSSH_CRYPTO_HPP

#include "keys.hpp"
#include <cstdint>
#include <string>

namespace VanitySsh {

    class Crypto {
    public:
        /**
         * @brief Initializes the cryptographic library. Must be called once.
         * @return 0 on success, -1 on error.
         */
        static int init();

        /**
         * @brief Generates a fresh Ed25519 key pair from a random seed.
         * @return The seed and the public key derived from it.
         * @throws VanitySsh::KeyGenerationError if the primitive fails.
         */
        static RawKeyPair generate_keypair();

        /**
         * @brief Deterministically derives the Ed25519 key pair for a seed.
         * @param seed A 32-byte seed.
         * @return The seed and its public key.
         * @throws VanitySsh::InvalidArgument if the seed has the wrong size.
         */
        static RawKeyPair keypair_from_seed(const Seed& seed);

        /**
         * @brief Draws a random 32-bit check integer for private key containers.
         */
        static uint32_t random_checkint();

        /**
         * @brief Encodes bytes as padded base64 (standard alphabet).
         */
        static std::string base64_encode(const byte_vector& data);

        /**
         * @brief Decodes padded base64 (standard alphabet).
         * @throws VanitySsh::FormatError if the input is not valid base64.
         */
        static byte_vector base64_decode(const std::string& text);
    };

} // namespace VanitySsh

#endif // VANITYSSH_CRYPTO_HPP
