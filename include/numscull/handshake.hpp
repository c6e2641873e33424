#ifndef NUMSCULL_HANDSHAKE_HPP
#define NUMSCULL_HANDSHAKE_HPP

#include "channel.hpp"
#include "handshake_messages.hpp"
#include "keys.hpp"
#include "transport.hpp"

#include <optional>

namespace Numscull {

    enum class Role {
        CLIENT,
        SERVER
    };

    /**
     * @brief Drives one handshake attempt over a freshly opened transport.
     *
     * The sequence is linear:
     *   CONNECTED -> INIT_SENT -> INIT_ACKED -> KEYS_EXCHANGED -> READY
     * Any failure moves to FAILED and is final; a retry needs a new transport
     * and a new Handshake, which also means new ephemeral keys.
     */
    class Handshake {
    public:
        enum class State {
            CONNECTED,
            INIT_SENT,
            INIT_ACKED,
            KEYS_EXCHANGED,
            READY,
            FAILED
        };

        /**
         * @brief Construct a new Handshake object.
         * @param role Whether this side is the client or the server.
         * @param transport The open transport. Must outlive the handshake.
         * @param static_keypair This side's long-lived identity key pair.
         */
        Handshake(Role role, Transport& transport, KeyPair static_keypair);

        // --- Client side ---

        /**
         * @brief [CLIENT] Sends the plaintext control/init request.
         */
        void send_init(const InitRequest& request);

        /**
         * @brief [CLIENT] Reads the plaintext init response and records the server's static key.
         * @throws HandshakeFailed if the response carries no usable key.
         */
        const InitResponse& receive_init_ack();

        /**
         * @brief [CLIENT] Server exchange first, then ours.
         * [SERVER] Ours first, then the client's.
         * @throws HandshakeFailed if the peer's exchange message does not open.
         */
        void exchange_keys();

        // --- Server side ---

        /**
         * @brief [SERVER] Reads the plaintext control/init request.
         */
        InitRequest receive_init();

        /**
         * @brief [SERVER] Answers the init request with the server's static key.
         * @param client_static_pk The identity's provisioned public key.
         */
        void send_init_ack(uint64_t message_id, const PublicKey& client_static_pk);

        /**
         * @brief Hands over the session keys and discards the ephemeral material.
         * Moves the handshake to READY.
         */
        ChannelKeys take_channel_keys();

        State state() const { return state_; }
        Role role() const { return role_; }
        const PublicKey& peer_static_pk() const;

    private:
        void expect(Role role, State state, const char* step) const;
        [[noreturn]] void fail_and_rethrow();

        Role role_;
        Transport& transport_;
        KeyPair static_keypair_;
        State state_ = State::CONNECTED;

        std::optional<PublicKey> peer_static_pk_;
        std::optional<InitResponse> init_response_;
        std::optional<ChannelKeys> channel_keys_;
    };

    const char* to_string(Handshake::State state);

} // namespace Numscull

#endif // NUMSCULL_HANDSHAKE_HPP
