#include "vanityssh/crypto.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "vanityssh/errors.hpp"

namespace {

VanitySsh::byte_vector from_hex(const std::string& hex) {
    VanitySsh::byte_vector out;
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

}  // namespace

TEST(CryptoTest, GenerateKeypairSizes) {
    ASSERT_EQ(VanitySsh::Crypto::init(), 0);

    auto kp = VanitySsh::Crypto::generate_keypair();
    ASSERT_EQ(kp.seed.data.size(), VanitySsh::SEED_BYTES);
    ASSERT_EQ(kp.publicKey.data.size(), VanitySsh::PUBLIC_KEY_BYTES);

    // Two draws never share a seed
    auto other = VanitySsh::Crypto::generate_keypair();
    ASSERT_NE(kp.seed.data, other.seed.data);
    ASSERT_NE(kp.publicKey.data, other.publicKey.data);
}

TEST(CryptoTest, GeneratedPublicKeyIsDerivedFromSeed) {
    ASSERT_EQ(VanitySsh::Crypto::init(), 0);

    auto kp = VanitySsh::Crypto::generate_keypair();
    auto derived = VanitySsh::Crypto::keypair_from_seed(kp.seed);
    ASSERT_EQ(derived.publicKey.data, kp.publicKey.data);
    ASSERT_EQ(derived.seed.data, kp.seed.data);
}

TEST(CryptoTest, KeypairFromSeedKnownAnswer) {
    ASSERT_EQ(VanitySsh::Crypto::init(), 0);

    // RFC 8032, section 7.1, TEST 1
    VanitySsh::Seed seed;
    seed.data = from_hex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
    auto kp = VanitySsh::Crypto::keypair_from_seed(seed);

    ASSERT_EQ(kp.publicKey.data, from_hex("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a"));
}

TEST(CryptoTest, KeypairFromSeedRejectsWrongSize) {
    ASSERT_EQ(VanitySsh::Crypto::init(), 0);

    VanitySsh::Seed seed;
    seed.data.resize(31, 0x42);
    ASSERT_THROW(VanitySsh::Crypto::keypair_from_seed(seed), VanitySsh::InvalidArgument);
}

TEST(CryptoTest, Base64) {
    ASSERT_EQ(VanitySsh::Crypto::init(), 0);

    std::string text = "ssh-ed25519";
    VanitySsh::byte_vector data(text.begin(), text.end());
    ASSERT_EQ(VanitySsh::Crypto::base64_encode(data), "c3NoLWVkMjU1MTk=");
    ASSERT_EQ(VanitySsh::Crypto::base64_decode("c3NoLWVkMjU1MTk="), data);

    ASSERT_EQ(VanitySsh::Crypto::base64_encode({}), "");

    ASSERT_THROW(VanitySsh::Crypto::base64_decode("c3No*WVk"), VanitySsh::FormatError);
}
