#include "numscull/crypto.hpp"

#include <sodium.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>

#include "numscull/errors.hpp"

namespace fs = std::filesystem;

namespace Numscull {

    static std::atomic<bool> g_sodium_initialized = false;

    int Crypto::init() {
        if (g_sodium_initialized) {
            return 0;  // Already successfully initialized
        }

        // 0 = first init, 1 = already initialized elsewhere, -1 = failure
        if (sodium_init() < 0) {
            return -1;
        }

        g_sodium_initialized = true;
        return 0;
    }

    KeyPair Crypto::generate_keypair() {
        KeyPair kp;
        randombytes_buf(kp.secretKey.data.data(), kp.secretKey.data.size());
        if (crypto_scalarmult_base(kp.publicKey.data.data(), kp.secretKey.data.data()) != 0) {
            throw RuntimeError("crypto_scalarmult_base failed.");
        }
        return kp;
    }

    std::string Crypto::identity_path(const std::string& identity, const std::string& config_dir) {
        return (fs::path(config_dir) / "identities" / identity).string();
    }

    KeyPair Crypto::load_keypair(const std::string& identity, const std::string& config_dir) {
        const std::string path = identity_path(identity, config_dir);

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw IdentityNotFound("Cannot open identity file: " + path);
        }

        byte_vector raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (raw.size() != KEY_BYTES * 2) {
            sodium_memzero(raw.data(), raw.size());
            throw InvalidKeyFormat("Expected 64-byte identity file, got " + std::to_string(raw.size()) +
                                   " bytes: " + path);
        }

        KeyPair kp;
        std::copy(raw.begin(), raw.begin() + KEY_BYTES, kp.publicKey.data.begin());
        std::copy(raw.begin() + KEY_BYTES, raw.end(), kp.secretKey.data.begin());
        sodium_memzero(raw.data(), raw.size());
        return kp;
    }

    void Crypto::write_keypair(const std::string& identity, const std::string& config_dir, const KeyPair& keypair) {
        std::error_code ec;
        const fs::path identities_dir = fs::path(config_dir) / "identities";
        const fs::path users_dir = fs::path(config_dir) / "users";
        fs::create_directories(identities_dir, ec);
        if (ec) {
            throw RuntimeError("Cannot create " + identities_dir.string() + ": " + ec.message());
        }
        fs::create_directories(users_dir, ec);
        if (ec) {
            throw RuntimeError("Cannot create " + users_dir.string() + ": " + ec.message());
        }

        const fs::path identity_file = identities_dir / identity;
        std::ofstream out(identity_file, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(keypair.publicKey.data.data()), keypair.publicKey.data.size());
        out.write(reinterpret_cast<const char*>(keypair.secretKey.data.data()), keypair.secretKey.data.size());
        if (!out) {
            throw RuntimeError("Cannot write identity file: " + identity_file.string());
        }

        const fs::path pub_file = users_dir / (identity + ".pub");
        std::ofstream pub(pub_file, std::ios::binary | std::ios::trunc);
        pub.write(reinterpret_cast<const char*>(keypair.publicKey.data.data()), keypair.publicKey.data.size());
        if (!pub) {
            throw RuntimeError("Cannot write public key file: " + pub_file.string());
        }
    }

    Nonce Crypto::counter_nonce(uint64_t counter) {
        Nonce nonce{};
        for (std::size_t i = 0; i < sizeof(counter); ++i) {
            nonce[i] = static_cast<uint8_t>(counter >> (8 * i));
        }
        return nonce;
    }

    Nonce Crypto::random_nonce() {
        Nonce nonce;
        randombytes_buf(nonce.data(), nonce.size());
        return nonce;
    }

    byte_vector Crypto::random_bytes(std::size_t size) {
        byte_vector out(size);
        fill_random(out.data(), out.size());
        return out;
    }

    void Crypto::fill_random(uint8_t* buffer, std::size_t size) {
        if (size > 0) {
            randombytes_buf(buffer, size);
        }
    }

    byte_vector Crypto::encrypt(const byte_vector& plaintext,
                                const Nonce& nonce,
                                const PublicKey& recipient_pk,
                                const SecretKey& sender_sk) {
        byte_vector ciphertext(plaintext.size() + crypto_box_MACBYTES);
        if (crypto_box_easy(ciphertext.data(),
                            plaintext.data(),
                            plaintext.size(),
                            nonce.data(),
                            recipient_pk.data.data(),
                            sender_sk.data.data()) != 0) {
            throw EncryptionFailed("crypto_box_easy failed.");
        }
        return ciphertext;
    }

    byte_vector Crypto::decrypt(const byte_vector& ciphertext,
                                const Nonce& nonce,
                                const PublicKey& sender_pk,
                                const SecretKey& recipient_sk) {
        if (ciphertext.size() < crypto_box_MACBYTES) {
            throw AuthenticationFailed("Ciphertext shorter than the authentication tag.");
        }

        byte_vector plaintext(ciphertext.size() - crypto_box_MACBYTES);
        if (crypto_box_open_easy(plaintext.data(),
                                 ciphertext.data(),
                                 ciphertext.size(),
                                 nonce.data(),
                                 sender_pk.data.data(),
                                 recipient_sk.data.data()) != 0) {
            throw AuthenticationFailed("Failed to decrypt message. Authentication tag is invalid.");
        }
        return plaintext;
    }

    std::string Crypto::base64_encode(const byte_vector& data) {
        const std::size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string out(encoded_len, '\0');
        sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), sodium_base64_VARIANT_ORIGINAL);
        out.resize(encoded_len - 1);  // drop the terminating NUL
        return out;
    }

    byte_vector Crypto::base64_decode(const std::string& text) {
        byte_vector out(text.size() / 4 * 3 + 3);
        std::size_t out_len = 0;
        const char* end = nullptr;
        if (sodium_base642bin(out.data(),
                              out.size(),
                              text.data(),
                              text.size(),
                              " \r\n",
                              &out_len,
                              &end,
                              sodium_base64_VARIANT_ORIGINAL) != 0 ||
            end != text.data() + text.size()) {
            throw InvalidArgument("Invalid base64 data.");
        }
        out.resize(out_len);
        return out;
    }

}  // namespace Numscull
