#include "vanityssh/openssh.hpp"

#include <algorithm>
#include <sstream>

#include "vanityssh/crypto.hpp"
#include "vanityssh/errors.hpp"
#include "vanityssh/wire.hpp"

namespace VanitySsh {

namespace {

    std::string auth_magic() {
        // Keep the terminating NUL, it is part of the magic.
        return std::string(OPENSSH_AUTH_MAGIC, OPENSSH_AUTH_MAGIC_LEN);
    }

    PublicKey parse_public_key_blob(const byte_vector& blob) {
        WireReader reader(blob);
        std::string key_type = reader.read_string();
        if (key_type != KEY_TYPE_ED25519) {
            throw FormatError("Unsupported key type: " + key_type);
        }
        PublicKey public_key;
        public_key.data = reader.read_bytes();
        if (public_key.data.size() != PUBLIC_KEY_BYTES) {
            throw FormatError("Invalid Ed25519 public key length.");
        }
        if (reader.has_more()) {
            throw FormatError("Trailing data after public key blob.");
        }
        return public_key;
    }

}  // namespace

void OpenSsh::validate_key_pair(const RawKeyPair& key_pair) {
    if (key_pair.seed.data.size() != SEED_BYTES) {
        throw InternalInvariantViolation("Key generator returned a seed of unexpected size.");
    }
    if (key_pair.publicKey.data.size() != PUBLIC_KEY_BYTES) {
        throw InternalInvariantViolation("Key generator returned a public key of unexpected size.");
    }
}

// --- Public key ---

std::string EncodedPublicKey::to_string() const {
    return algorithm + " " + body + " " + comment;
}

byte_vector OpenSsh::public_key_blob(const PublicKey& public_key) {
    if (public_key.data.size() != PUBLIC_KEY_BYTES) {
        throw InternalInvariantViolation("Ed25519 public key must be 32 bytes.");
    }
    return WireWriter().add_string(KEY_TYPE_ED25519).add_bytes(public_key.data).build();
}

EncodedPublicKey OpenSsh::encode_public_key(const PublicKey& public_key, const std::string& comment) {
    EncodedPublicKey encoded;
    encoded.algorithm = KEY_TYPE_ED25519;
    encoded.body = Crypto::base64_encode(public_key_blob(public_key));
    encoded.comment = comment;
    return encoded;
}

std::string OpenSsh::extract_public_key_body(const std::string& line) {
    std::istringstream fields(line);
    std::string algorithm;
    std::string body;
    if (!(fields >> algorithm >> body)) {
        throw FormatError("Invalid SSH public key format.");
    }
    if (algorithm != KEY_TYPE_ED25519) {
        throw FormatError("Expected key type " + std::string(KEY_TYPE_ED25519) + ", got " + algorithm);
    }
    return body;
}

PublicKey OpenSsh::decode_public_key(const std::string& line) {
    return parse_public_key_blob(Crypto::base64_decode(extract_public_key_body(line)));
}

// --- Private key ---

EncodedPrivateKey OpenSsh::encode_private_key(const RawKeyPair& key_pair, const std::string& comment) {
    return encode_private_key(key_pair, comment, Crypto::random_checkint());
}

EncodedPrivateKey OpenSsh::encode_private_key(const RawKeyPair& key_pair,
                                              const std::string& comment,
                                              uint32_t checkint) {
    validate_key_pair(key_pair);

    byte_vector secret;
    secret.reserve(SECRET_KEY_BYTES);
    secret.insert(secret.end(), key_pair.seed.data.begin(), key_pair.seed.data.end());
    secret.insert(secret.end(), key_pair.publicKey.data.begin(), key_pair.publicKey.data.end());

    WireWriter private_section;
    private_section.add_u32(checkint)
        .add_u32(checkint)
        .add_string(KEY_TYPE_ED25519)
        .add_bytes(key_pair.publicKey.data)
        .add_bytes(secret)
        .add_string(comment);

    // Deterministic padding 1, 2, 3, ... up to the cipher block size
    byte_vector padding;
    for (uint8_t i = 1; (private_section.size() + padding.size()) % OPENSSH_BLOCK_SIZE != 0; ++i) {
        padding.push_back(i);
    }
    private_section.add_raw(padding);

    byte_vector container = WireWriter()
                                .add_raw(auth_magic())
                                .add_string(OPENSSH_CIPHER_NONE)
                                .add_string(OPENSSH_KDF_NONE)
                                .add_string("")  // kdf options
                                .add_u32(1)      // number of keys
                                .add_bytes(public_key_blob(key_pair.publicKey))
                                .add_bytes(private_section.build())
                                .build();

    std::fill(secret.begin(), secret.end(), 0);

    EncodedPrivateKey encoded;
    encoded.armored = armor(container);
    return encoded;
}

std::string OpenSsh::armor(const byte_vector& container) {
    std::string body = Crypto::base64_encode(container);

    std::string out;
    out.reserve(body.size() + body.size() / OPENSSH_ARMOR_LINE_WIDTH + 80);
    out += OPENSSH_PRIVATE_BEGIN;
    out += '\n';
    for (size_t pos = 0; pos < body.size(); pos += OPENSSH_ARMOR_LINE_WIDTH) {
        out.append(body, pos, OPENSSH_ARMOR_LINE_WIDTH);
        out += '\n';
    }
    out += OPENSSH_PRIVATE_END;
    out += '\n';
    return out;
}

byte_vector OpenSsh::dearmor(const std::string& armored) {
    size_t begin = armored.find(OPENSSH_PRIVATE_BEGIN);
    if (begin == std::string::npos) {
        throw FormatError("Missing OpenSSH private key header.");
    }
    begin += sizeof(OPENSSH_PRIVATE_BEGIN) - 1;

    size_t end = armored.find(OPENSSH_PRIVATE_END, begin);
    if (end == std::string::npos) {
        throw FormatError("Missing OpenSSH private key footer.");
    }

    std::string body;
    body.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
        char c = armored[i];
        if (c != '\n' && c != '\r' && c != ' ' && c != '\t') {
            body += c;
        }
    }
    return Crypto::base64_decode(body);
}

Seed DecodedPrivateKey::seed() const {
    Seed out;
    out.data.assign(secret.begin(), secret.begin() + std::min(secret.size(), SEED_BYTES));
    return out;
}

DecodedPrivateKey OpenSsh::decode_private_key(const std::string& armored) {
    byte_vector container = dearmor(armored);
    WireReader reader(container);

    byte_vector magic = reader.read_raw(OPENSSH_AUTH_MAGIC_LEN);
    if (std::string(magic.begin(), magic.end()) != auth_magic()) {
        throw FormatError("Not an openssh-key-v1 container.");
    }
    if (reader.read_string() != OPENSSH_CIPHER_NONE) {
        throw FormatError("Encrypted private keys are not supported.");
    }
    if (reader.read_string() != OPENSSH_KDF_NONE) {
        throw FormatError("Unexpected KDF for an unencrypted key.");
    }
    if (!reader.read_bytes().empty()) {
        throw FormatError("Unexpected KDF options for an unencrypted key.");
    }
    if (reader.read_u32() != 1) {
        throw FormatError("Only containers holding exactly one key are supported.");
    }

    DecodedPrivateKey decoded;
    decoded.public_blob = reader.read_bytes();
    PublicKey outer_public_key = parse_public_key_blob(decoded.public_blob);

    byte_vector private_section = reader.read_bytes();
    if (reader.has_more()) {
        throw FormatError("Trailing data after private section.");
    }
    if (private_section.size() % OPENSSH_BLOCK_SIZE != 0) {
        throw FormatError("Private section is not a multiple of the cipher block size.");
    }
    decoded.private_section_size = private_section.size();

    WireReader section(private_section);
    decoded.checkint1 = section.read_u32();
    decoded.checkint2 = section.read_u32();
    if (decoded.checkint1 != decoded.checkint2) {
        throw FormatError("Check integers do not match.");
    }

    decoded.key_type = section.read_string();
    if (decoded.key_type != KEY_TYPE_ED25519) {
        throw FormatError("Unsupported key type: " + decoded.key_type);
    }
    decoded.public_key.data = section.read_bytes();
    if (decoded.public_key.data != outer_public_key.data) {
        throw FormatError("Public key in private section differs from the public key blob.");
    }
    decoded.secret = section.read_bytes();
    if (decoded.secret.size() != SECRET_KEY_BYTES ||
        !std::equal(decoded.public_key.data.begin(), decoded.public_key.data.end(), decoded.secret.begin() + SEED_BYTES)) {
        throw FormatError("Malformed Ed25519 secret key.");
    }
    decoded.comment = section.read_string();

    decoded.padding = section.read_raw(section.remaining());
    for (size_t i = 0; i < decoded.padding.size(); ++i) {
        if (decoded.padding[i] != static_cast<uint8_t>(i + 1)) {
            throw FormatError("Invalid private section padding.");
        }
    }

    return decoded;
}

bool OpenSsh::verify_key_pair(const std::string& public_line, const std::string& armored) {
    PublicKey public_key = decode_public_key(public_line);
    DecodedPrivateKey decoded = decode_private_key(armored);
    if (decoded.public_key.data != public_key.data) {
        return false;
    }
    RawKeyPair derived = Crypto::keypair_from_seed(decoded.seed());
    return derived.publicKey.data == public_key.data;
}

} // namespace VanitySsh
