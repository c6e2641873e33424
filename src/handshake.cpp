#include "numscull/handshake.hpp"

#include <exception>
#include <string>

#include "numscull/crypto.hpp"
#include "numscull/errors.hpp"
#include "numscull/framing.hpp"

namespace Numscull {

namespace {

byte_vector to_bytes(const json& message) {
    const std::string text = message.dump();
    return byte_vector(text.begin(), text.end());
}

json parse_plaintext(Transport& transport) {
    const byte_vector payload = read_plaintext(transport);
    try {
        return json::parse(payload.begin(), payload.end());
    } catch (const json::parse_error& e) {
        throw HandshakeFailed(std::string("Malformed plaintext message: ") + e.what());
    }
}

} // namespace

Handshake::Handshake(Role role, Transport& transport, KeyPair static_keypair)
    : role_(role), transport_(transport), static_keypair_(std::move(static_keypair)) {}

// --- Client ---

void Handshake::send_init(const InitRequest& request) {
    expect(Role::CLIENT, State::CONNECTED, "send_init");
    try {
        transport_.write(pack_plaintext(to_bytes(request.to_json())));
        state_ = State::INIT_SENT;
    } catch (...) {
        fail_and_rethrow();
    }
}

const InitResponse& Handshake::receive_init_ack() {
    expect(Role::CLIENT, State::INIT_SENT, "receive_init_ack");
    try {
        init_response_ = InitResponse::from_json(parse_plaintext(transport_));
        peer_static_pk_ = init_response_->server_pk;
        state_ = State::INIT_ACKED;
    } catch (...) {
        fail_and_rethrow();
    }
    return *init_response_;
}

void Handshake::exchange_keys() {
    expect(role_, State::INIT_ACKED, "exchange_keys");
    try {
        const PublicKey& peer_pk = *peer_static_pk_;
        const SecretKey& own_sk = static_keypair_.secretKey;

        // One key pair per direction, so encryption and decryption never share key material.
        KeyPair recv_kp = Crypto::generate_keypair();
        KeyPair send_kp = Crypto::generate_keypair();
        const EphemeralKeys ours{recv_kp.publicKey, send_kp.publicKey};

        EphemeralKeys theirs;
        if (role_ == Role::CLIENT) {
            theirs = KeyExchangeMessage::deserialize(transport_.read(KeyExchangeMessage::WIRE_SIZE))
                         .open(peer_pk, own_sk);
            transport_.write(KeyExchangeMessage::seal(ours, peer_pk, own_sk).serialize());
        } else {
            transport_.write(KeyExchangeMessage::seal(ours, peer_pk, own_sk).serialize());
            theirs = KeyExchangeMessage::deserialize(transport_.read(KeyExchangeMessage::WIRE_SIZE))
                         .open(peer_pk, own_sk);
        }

        ChannelKeys keys;
        keys.ours_recv_sk = recv_kp.secretKey;
        keys.ours_send_sk = send_kp.secretKey;
        keys.theirs_recv_pk = theirs.send_pk;
        keys.theirs_send_pk = theirs.recv_pk;
        channel_keys_ = std::move(keys);
        state_ = State::KEYS_EXCHANGED;
    } catch (...) {
        fail_and_rethrow();
    }
}

// --- Server ---

InitRequest Handshake::receive_init() {
    expect(Role::SERVER, State::CONNECTED, "receive_init");
    try {
        InitRequest request = InitRequest::from_json(parse_plaintext(transport_));
        state_ = State::INIT_SENT;
        return request;
    } catch (...) {
        fail_and_rethrow();
    }
}

void Handshake::send_init_ack(uint64_t message_id, const PublicKey& client_static_pk) {
    expect(Role::SERVER, State::INIT_SENT, "send_init_ack");
    try {
        InitResponse response;
        response.server_pk = static_keypair_.publicKey;
        response.valid = true;
        transport_.write(pack_plaintext(to_bytes(response.to_json(message_id))));
        peer_static_pk_ = client_static_pk;
        state_ = State::INIT_ACKED;
    } catch (...) {
        fail_and_rethrow();
    }
}

// --- Common ---

ChannelKeys Handshake::take_channel_keys() {
    expect(role_, State::KEYS_EXCHANGED, "take_channel_keys");
    ChannelKeys keys = std::move(*channel_keys_);
    channel_keys_.reset();
    state_ = State::READY;
    return keys;
}

const PublicKey& Handshake::peer_static_pk() const {
    if (!peer_static_pk_) {
        throw LogicError("Peer static key is not known yet.");
    }
    return *peer_static_pk_;
}

void Handshake::expect(Role role, State state, const char* step) const {
    if (role_ != role) {
        throw LogicError(std::string(step) + " is not available to this role.");
    }
    if (state_ != state) {
        throw LogicError(std::string(step) + " called in state " + to_string(state_) + ", expected " +
                         to_string(state));
    }
}

void Handshake::fail_and_rethrow() {
    state_ = State::FAILED;
    channel_keys_.reset();
    std::rethrow_exception(std::current_exception());
}

const char* to_string(Handshake::State state) {
    switch (state) {
        case Handshake::State::CONNECTED: return "CONNECTED";
        case Handshake::State::INIT_SENT: return "INIT_SENT";
        case Handshake::State::INIT_ACKED: return "INIT_ACKED";
        case Handshake::State::KEYS_EXCHANGED: return "KEYS_EXCHANGED";
        case Handshake::State::READY: return "READY";
        case Handshake::State::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

} // namespace Numscull
