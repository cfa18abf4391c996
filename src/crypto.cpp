#include "vanityssh/crypto.hpp"

#include <sodium.h>

#include <atomic>

#include "vanityssh/errors.hpp"

namespace VanitySsh {

    static std::atomic<bool> g_sodium_initialized = false;

    int Crypto::init() {
        if (g_sodium_initialized) {
            return 0;  // Already successfully initialized
        }

        if (sodium_init() < 0) {
            return -1;  // Initialization failed
        }

        g_sodium_initialized = true;
        return 0;
    }

    RawKeyPair Crypto::generate_keypair() {
        Seed seed;
        seed.data.resize(crypto_sign_SEEDBYTES);
        randombytes_buf(seed.data.data(), seed.data.size());
        return keypair_from_seed(seed);
    }

    RawKeyPair Crypto::keypair_from_seed(const Seed& seed) {
        if (seed.data.size() != crypto_sign_SEEDBYTES) {
            throw InvalidArgument("Invalid seed size for key derivation.");
        }

        RawKeyPair kp;
        kp.seed = seed;
        kp.publicKey.data.resize(crypto_sign_PUBLICKEYBYTES);
        unsigned char sk[crypto_sign_SECRETKEYBYTES];
        int rc = crypto_sign_seed_keypair(kp.publicKey.data.data(), sk, seed.data.data());
        sodium_memzero(sk, sizeof(sk));
        if (rc != 0) {
            throw KeyGenerationError("crypto_sign_seed_keypair failed.");
        }
        return kp;
    }

    uint32_t Crypto::random_checkint() {
        return randombytes_random();
    }

    std::string Crypto::base64_encode(const byte_vector& data) {
        constexpr int VARIANT = sodium_base64_VARIANT_ORIGINAL;
        // Encoded length includes the terminating NUL.
        std::string out(sodium_base64_ENCODED_LEN(data.size(), VARIANT), '\0');
        sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), VARIANT);
        out.resize(out.size() - 1);
        return out;
    }

    byte_vector Crypto::base64_decode(const std::string& text) {
        byte_vector out(text.size() / 4 * 3 + 3);
        size_t out_len = 0;
        if (sodium_base642bin(out.data(),
                              out.size(),
                              text.data(),
                              text.size(),
                              nullptr,  // no ignored characters
                              &out_len,
                              nullptr,  // the whole input must be consumed
                              sodium_base64_VARIANT_ORIGINAL) != 0) {
            throw FormatError("Invalid base64 data.");
        }
        out.resize(out_len);
        return out;
    }

}  // namespace VanitySsh
