#ifndef NUMSCULL_KEYS_HPP
#define NUMSCULL_KEYS_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Numscull {

    // Using a simple vector of bytes for variable-length data.
    using byte_vector = std::vector<uint8_t>;

    constexpr std::size_t KEY_BYTES = 32;
    constexpr std::size_t NONCE_BYTES = 24;

    // An X25519 public key.
    struct PublicKey {
        std::array<uint8_t, KEY_BYTES> data{};

        bool operator==(const PublicKey& other) const { return data == other.data; }
        bool operator!=(const PublicKey& other) const { return data != other.data; }
    };

    // An X25519 secret key. The bytes are wiped when the object goes away.
    struct SecretKey {
        std::array<uint8_t, KEY_BYTES> data{};

        SecretKey() = default;
        SecretKey(const SecretKey&) = default;
        SecretKey(SecretKey&&) = default;
        SecretKey& operator=(const SecretKey&) = default;
        SecretKey& operator=(SecretKey&&) = default;
        ~SecretKey();
    };

    // A key pair consisting of a public and a secret key.
    struct KeyPair {
        PublicKey publicKey;
        SecretKey secretKey;
    };

    // A NaCl box nonce.
    using Nonce = std::array<uint8_t, NONCE_BYTES>;

} // namespace Numscull

#endif // NUMSCULL_KEYS_HPP
