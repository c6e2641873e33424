#include "numscull/channel.hpp"

#include <iostream>
#include <limits>
#include <string>

#include "numscull/crypto.hpp"
#include "numscull/errors.hpp"

namespace Numscull {

EncryptedChannel::EncryptedChannel(std::unique_ptr<Transport> transport, ChannelKeys keys)
    : transport_(std::move(transport)), keys_(std::move(keys)) {
    if (!transport_) {
        throw InvalidArgument("EncryptedChannel requires a transport.");
    }
}

EncryptedChannel::~EncryptedChannel() {
    close();
}

void EncryptedChannel::send(const nlohmann::json& message) {
    const std::string text = message.dump();
    send_bytes(byte_vector(text.begin(), text.end()));
}

nlohmann::json EncryptedChannel::recv() {
    const byte_vector body = recv_bytes();
    try {
        return nlohmann::json::parse(body.begin(), body.end());
    } catch (const nlohmann::json::parse_error& e) {
        close();
        throw RuntimeError(std::string("Malformed JSON from peer: ") + e.what());
    }
}

void EncryptedChannel::send_bytes(const byte_vector& body) {
    ensure_open();

    // Size errors are detected before anything reaches the wire, so the
    // channel stays usable after a MessageTooLarge.
    const std::vector<byte_vector> chunks = split_message(pack_plaintext(body));

    try {
        for (const auto& chunk : chunks) {
            send_block(chunk);
        }
    } catch (...) {
        close();
        throw;
    }
}

byte_vector EncryptedChannel::recv_bytes() {
    ensure_open();

    MessageAssembler assembler;
    try {
        while (!assembler.feed(recv_raw())) {
        }
    } catch (...) {
        close();
        throw;
    }
    return assembler.body();
}

byte_vector EncryptedChannel::recv_raw() {
    ensure_open();

    try {
        const byte_vector ciphertext = transport_->read(ENCRYPTED_BLOCK_SIZE);
        const Nonce nonce = Crypto::counter_nonce(recv_nonce_++);
        const byte_vector block = Crypto::decrypt(ciphertext, nonce, keys_.theirs_recv_pk, keys_.ours_recv_sk);
        return unpack_block(block);
    } catch (...) {
        close();
        throw;
    }
}

void EncryptedChannel::send_block(const byte_vector& payload) {
    if (send_nonce_ == std::numeric_limits<uint64_t>::max()) {
        throw EncryptionFailed("Send nonce counter exhausted.");
    }

    const byte_vector block = pack_block(payload);
    const Nonce nonce = Crypto::counter_nonce(send_nonce_++);
    transport_->write(Crypto::encrypt(block, nonce, keys_.theirs_send_pk, keys_.ours_send_sk));
}

bool EncryptedChannel::is_open() const {
    return !closed_ && transport_->is_open();
}

void EncryptedChannel::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    try {
        transport_->close();
    } catch (const std::exception& e) {
        std::cerr << "Error closing transport: " << e.what() << std::endl;
    }
}

void EncryptedChannel::ensure_open() const {
    if (!is_open()) {
        throw TransportClosed("Channel is closed.");
    }
}

} // namespace Numscull
