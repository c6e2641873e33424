#include "numscull/handshake_messages.hpp"

#include <algorithm>

#include "numscull/crypto.hpp"
#include "numscull/errors.hpp"

namespace Numscull {

// InitRequest

json InitRequest::to_json() const {
    return json{{"id", id}, {"method", INIT_METHOD}, {"params", {{"identity", identity}, {"version", version}}}};
}

InitRequest InitRequest::from_json(const json& message) {
    auto method = message.is_object() ? message.find("method") : message.end();
    if (!message.is_object() || method == message.end() || !method->is_string() || *method != INIT_METHOD) {
        throw HandshakeFailed("Expected a control/init request.");
    }

    InitRequest request;
    request.identity = "unknown";
    auto id = message.find("id");
    if (id != message.end() && id->is_number_unsigned()) {
        request.id = id->get<uint64_t>();
    }
    auto params = message.find("params");
    if (params != message.end() && params->is_object()) {
        auto identity = params->find("identity");
        if (identity != params->end() && identity->is_string()) {
            request.identity = identity->get<std::string>();
        }
        auto version = params->find("version");
        if (version != params->end() && version->is_string()) {
            request.version = version->get<std::string>();
        }
    }
    return request;
}

// InitResponse

json InitResponse::to_json(uint64_t id) const {
    byte_vector pk(server_pk.data.begin(), server_pk.data.end());
    return json{{"id", id},
                {"method", INIT_METHOD},
                {"params", {{"valid", valid}, {"publicKey", {{"bytes", Crypto::base64_encode(pk)}}}}}};
}

InitResponse InitResponse::from_json(const json& message) {
    if (!message.is_object()) {
        throw HandshakeFailed("Init response is not a JSON object.");
    }

    const json* body = nullptr;
    for (const char* field : {"params", "result"}) {
        auto it = message.find(field);
        if (it != message.end() && it->is_object() && it->contains("publicKey")) {
            body = &*it;
            break;
        }
    }
    if (body == nullptr) {
        throw HandshakeFailed("No publicKey in init response: " + message.dump());
    }

    InitResponse response;
    response.message = message;
    auto valid = body->find("valid");
    if (valid != body->end() && valid->is_boolean()) {
        response.valid = valid->get<bool>();
    }
    if (!response.valid) {
        throw HandshakeFailed("Server rejected the identity.");
    }

    const json& public_key = body->at("publicKey");
    auto bytes = public_key.is_object() ? public_key.find("bytes") : public_key.end();
    if (!public_key.is_object() || bytes == public_key.end() || !bytes->is_string()) {
        throw HandshakeFailed("Malformed publicKey in init response: " + public_key.dump());
    }

    byte_vector decoded;
    try {
        decoded = Crypto::base64_decode(bytes->get<std::string>());
    } catch (const InvalidArgument&) {
        throw HandshakeFailed("Server public key is not valid base64.");
    }
    if (decoded.size() != KEY_BYTES) {
        throw HandshakeFailed("Server public key must be 32 bytes, got " + std::to_string(decoded.size()));
    }

    std::copy(decoded.begin(), decoded.end(), response.server_pk.data.begin());
    return response;
}

// EphemeralKeys

byte_vector EphemeralKeys::pack() const {
    byte_vector block(BLOCK_SIZE);
    std::copy(recv_pk.data.begin(), recv_pk.data.end(), block.begin());
    std::copy(send_pk.data.begin(), send_pk.data.end(), block.begin() + KEY_BYTES);
    Crypto::fill_random(block.data() + KEY_BYTES * 2, BLOCK_SIZE - KEY_BYTES * 2);
    return block;
}

EphemeralKeys EphemeralKeys::unpack(const byte_vector& block) {
    if (block.size() < KEY_BYTES * 2) {
        throw HandshakeFailed("Key exchange block too short.");
    }
    EphemeralKeys keys;
    std::copy(block.begin(), block.begin() + KEY_BYTES, keys.recv_pk.data.begin());
    std::copy(block.begin() + KEY_BYTES, block.begin() + KEY_BYTES * 2, keys.send_pk.data.begin());
    return keys;
}

// KeyExchangeMessage

byte_vector KeyExchangeMessage::serialize() const {
    byte_vector buffer;
    buffer.reserve(NONCE_BYTES + ciphertext.size());
    buffer.insert(buffer.end(), nonce.begin(), nonce.end());
    buffer.insert(buffer.end(), ciphertext.begin(), ciphertext.end());
    return buffer;
}

KeyExchangeMessage KeyExchangeMessage::deserialize(const byte_vector& data) {
    if (data.size() != WIRE_SIZE) {
        throw HandshakeFailed("Key exchange message must be " + std::to_string(WIRE_SIZE) + " bytes, got " +
                              std::to_string(data.size()));
    }
    KeyExchangeMessage message;
    std::copy(data.begin(), data.begin() + NONCE_BYTES, message.nonce.begin());
    message.ciphertext.assign(data.begin() + NONCE_BYTES, data.end());
    return message;
}

KeyExchangeMessage KeyExchangeMessage::seal(const EphemeralKeys& keys,
                                            const PublicKey& peer_static_pk,
                                            const SecretKey& own_static_sk) {
    KeyExchangeMessage message;
    message.nonce = Crypto::random_nonce();
    message.ciphertext = Crypto::encrypt(keys.pack(), message.nonce, peer_static_pk, own_static_sk);
    return message;
}

EphemeralKeys KeyExchangeMessage::open(const PublicKey& peer_static_pk, const SecretKey& own_static_sk) const {
    try {
        return EphemeralKeys::unpack(Crypto::decrypt(ciphertext, nonce, peer_static_pk, own_static_sk));
    } catch (const AuthenticationFailed& e) {
        throw HandshakeFailed(std::string("Key exchange message did not authenticate: ") + e.what());
    }
}

}  // namespace Numscull
