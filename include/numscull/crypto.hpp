#ifndef NUMSCULL_CRYPTO_HPP
#define NUMSCULL_CRYPTO_HPP

#include "keys.hpp"

#include <cstdint>
#include <string>

namespace Numscull {

    // Authentication tag appended by crypto_box.
    constexpr std::size_t MAC_BYTES = 16;

    class Crypto {
    public:
        /**
         * @brief Initializes the cryptographic library. Safe to call repeatedly.
         * @return 0 on success, -1 if libsodium (and its RNG) could not be initialized.
         */
        static int init();

        /**
         * @brief Generates an X25519 key pair from the system CSPRNG.
         *
         * The secret key is 32 random bytes and the public key is its scalar
         * multiplication with the curve base point.
         */
        static KeyPair generate_keypair();

        /**
         * @brief Path of the 64-byte identity file for a given identity.
         */
        static std::string identity_path(const std::string& identity, const std::string& config_dir);

        /**
         * @brief Loads a long-lived identity key pair.
         *
         * The file holds the 32-byte public key followed by the 32-byte secret key.
         * @throws IdentityNotFound if the file does not exist.
         * @throws InvalidKeyFormat if the file is not exactly 64 bytes.
         */
        static KeyPair load_keypair(const std::string& identity, const std::string& config_dir);

        /**
         * @brief Provisions an identity: writes identities/<identity> (64 bytes)
         * and users/<identity>.pub (the public key alone, as a server reads it).
         * @throws RuntimeError if either file cannot be written.
         */
        static void write_keypair(const std::string& identity, const std::string& config_dir, const KeyPair& keypair);

        /**
         * @brief Builds the deterministic nonce for a message counter:
         * 8-byte little-endian counter followed by 16 zero bytes.
         */
        static Nonce counter_nonce(uint64_t counter);

        static Nonce random_nonce();
        static byte_vector random_bytes(std::size_t size);
        static void fill_random(uint8_t* buffer, std::size_t size);

        /**
         * @brief NaCl box (X25519 + XSalsa20-Poly1305).
         * @return The ciphertext, MAC_BYTES longer than the plaintext.
         * @throws EncryptionFailed on a library fault.
         */
        static byte_vector encrypt(const byte_vector& plaintext,
                                   const Nonce& nonce,
                                   const PublicKey& recipient_pk,
                                   const SecretKey& sender_sk);

        /**
         * @brief Opens a NaCl box.
         * @throws AuthenticationFailed if the tag does not verify.
         */
        static byte_vector decrypt(const byte_vector& ciphertext,
                                   const Nonce& nonce,
                                   const PublicKey& sender_pk,
                                   const SecretKey& recipient_sk);

        // Standard base64 alphabet with padding.
        static std::string base64_encode(const byte_vector& data);

        /**
         * @throws InvalidArgument if the text is not valid base64.
         */
        static byte_vector base64_decode(const std::string& text);
    };

} // namespace Numscull

#endif // NUMSCULL_CRYPTO_HPP
