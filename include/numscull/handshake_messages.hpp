#ifndef NUMSCULL_HANDSHAKE_MESSAGES_HPP
#define NUMSCULL_HANDSHAKE_MESSAGES_HPP

#include "framing.hpp"
#include "keys.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace Numscull {

    using json = nlohmann::json;

    constexpr char INIT_METHOD[] = "control/init";

    // --- Plaintext phase ---

    struct InitRequest {
        std::string identity;
        std::string version;
        uint64_t id = 0;

        json to_json() const;
        static InitRequest from_json(const json& message);
    };

    struct InitResponse {
        PublicKey server_pk;
        bool valid = true;
        // The response as received.
        json message;

        json to_json(uint64_t id) const;

        /**
         * @brief Extracts the server's static key from params.publicKey.bytes
         * (or result.publicKey.bytes).
         * @throws HandshakeFailed if the key is absent, not base64, not 32 bytes,
         *         or the server marked the identity as invalid.
         */
        static InitResponse from_json(const json& message);
    };

    // --- Key exchange phase ---

    // The two ephemeral public keys a side announces, packed into one block.
    struct EphemeralKeys {
        PublicKey recv_pk;
        PublicKey send_pk;

        // [recv_pk][send_pk][random padding] = BLOCK_SIZE bytes
        byte_vector pack() const;
        static EphemeralKeys unpack(const byte_vector& block);
    };

    // [24-byte random nonce][528-byte box], sealed under the static keys.
    struct KeyExchangeMessage {
        static constexpr std::size_t WIRE_SIZE = NONCE_BYTES + ENCRYPTED_BLOCK_SIZE;

        Nonce nonce{};
        byte_vector ciphertext;

        byte_vector serialize() const;
        static KeyExchangeMessage deserialize(const byte_vector& data);

        static KeyExchangeMessage seal(const EphemeralKeys& keys,
                                       const PublicKey& peer_static_pk,
                                       const SecretKey& own_static_sk);

        /**
         * @throws HandshakeFailed if the box does not open.
         */
        EphemeralKeys open(const PublicKey& peer_static_pk, const SecretKey& own_static_sk) const;
    };

}  // namespace Numscull

#endif  // NUMSCULL_HANDSHAKE_MESSAGES_HPP
