#ifndef NUMSCULL_CHANNEL_HPP
#define NUMSCULL_CHANNEL_HPP

#include "framing.hpp"
#include "keys.hpp"
#include "transport.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>

namespace Numscull {

    /**
     * @brief The four session keys a finished key exchange yields.
     *
     * Naming follows the direction of use: theirs_send_pk is the peer key we
     * encrypt to (the peer's receive-labelled ephemeral key on the wire), and
     * theirs_recv_pk is the peer key we open boxes from (the peer's
     * send-labelled ephemeral key).
     */
    struct ChannelKeys {
        SecretKey ours_recv_sk;
        SecretKey ours_send_sk;
        PublicKey theirs_recv_pk;
        PublicKey theirs_send_pk;
    };

    /**
     * @brief Bidirectional encrypted channel over a transport.
     *
     * Every block on the wire is exactly ENCRYPTED_BLOCK_SIZE bytes and is boxed
     * under a counter nonce. Send and receive counters start at 1, advance by
     * one per block and never reset. Any failure closes the channel together
     * with its transport; afterwards every call throws TransportClosed.
     *
     * Not thread-safe: a channel belongs to a single session.
     */
    class EncryptedChannel {
    public:
        EncryptedChannel(std::unique_ptr<Transport> transport, ChannelKeys keys);
        ~EncryptedChannel();

        EncryptedChannel(const EncryptedChannel&) = delete;
        EncryptedChannel& operator=(const EncryptedChannel&) = delete;

        /**
         * @brief Serializes and sends one JSON message, spanning blocks as needed.
         */
        void send(const nlohmann::json& message);

        /**
         * @brief Receives and parses the next JSON message.
         */
        nlohmann::json recv();

        /**
         * @brief Sends [10-byte header][body] split across as many blocks as needed.
         * @throws MessageTooLarge if the body would span more than MAX_MESSAGE_BLOCKS.
         */
        void send_bytes(const byte_vector& body);

        /**
         * @brief Receives blocks until one complete [header][body] message is in, returns the body.
         */
        byte_vector recv_bytes();

        /**
         * @brief Reads, authenticates and unpacks exactly one block.
         * @throws AuthenticationFailed if the block does not verify.
         */
        byte_vector recv_raw();

        // Next counter values that will be used.
        uint64_t send_nonce() const { return send_nonce_; }
        uint64_t recv_nonce() const { return recv_nonce_; }

        bool is_open() const;
        void close();

    private:
        void send_block(const byte_vector& payload);
        void ensure_open() const;

        std::unique_ptr<Transport> transport_;
        ChannelKeys keys_;
        uint64_t send_nonce_ = 1;
        uint64_t recv_nonce_ = 1;
        bool closed_ = false;
    };

} // namespace Numscull

#endif // NUMSCULL_CHANNEL_HPP
