#include "numscull/framing.hpp"

#include <algorithm>
#include <cstdio>

#include "numscull/errors.hpp"
#include "numscull/transport.hpp"

namespace Numscull {

namespace {

bool is_space(uint8_t c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string printable(const byte_vector& bytes) {
    std::string out;
    for (uint8_t c : bytes) {
        if (c >= 0x20 && c < 0x7f) {
            out.push_back(static_cast<char>(c));
        } else {
            char hex[5];
            std::snprintf(hex, sizeof(hex), "\\x%02x", c);
            out += hex;
        }
    }
    return out;
}

} // namespace

std::string encode_header(std::size_t length) {
    if (length > 9999999999ULL) {
        throw MessageTooLarge("Payload length " + std::to_string(length) + " does not fit the header.");
    }
    char header[HEADER_SIZE + 1];
    std::snprintf(header, sizeof(header), "%010llu", static_cast<unsigned long long>(length));
    return std::string(header, HEADER_SIZE);
}

std::size_t decode_header(const byte_vector& header) {
    if (header.size() != HEADER_SIZE) {
        throw InvalidHeader("Header must be " + std::to_string(HEADER_SIZE) + " bytes, got " +
                            std::to_string(header.size()));
    }

    std::size_t begin = 0;
    std::size_t end = header.size();
    while (begin < end && is_space(header[begin])) ++begin;
    while (end > begin && is_space(header[end - 1])) --end;

    bool negative = false;
    if (begin < end && (header[begin] == '+' || header[begin] == '-')) {
        negative = header[begin] == '-';
        ++begin;
    }
    if (begin == end) {
        throw InvalidHeader("Invalid plaintext header: \"" + printable(header) + "\"");
    }

    uint64_t value = 0;
    for (std::size_t i = begin; i < end; ++i) {
        if (header[i] < '0' || header[i] > '9') {
            throw InvalidHeader("Invalid plaintext header: \"" + printable(header) + "\"");
        }
        value = value * 10 + static_cast<uint64_t>(header[i] - '0');
    }

    if (negative && value != 0) {
        throw InvalidHeader("Negative length in plaintext header: \"" + printable(header) + "\"");
    }
    return static_cast<std::size_t>(value);
}

byte_vector pack_plaintext(const byte_vector& payload) {
    const std::string header = encode_header(payload.size());
    byte_vector out;
    out.reserve(HEADER_SIZE + payload.size());
    out.insert(out.end(), header.begin(), header.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

byte_vector read_plaintext(Transport& transport) {
    const std::size_t length = decode_header(transport.read(HEADER_SIZE));
    if (length == 0) {
        return {};
    }
    return transport.read(length);
}

byte_vector pack_block(const byte_vector& payload) {
    if (payload.size() > BLOCK_CAPACITY) {
        throw MessageTooLarge("Block payload too large: " + std::to_string(payload.size()) + " > " +
                              std::to_string(BLOCK_CAPACITY));
    }

    byte_vector block(BLOCK_SIZE);
    block[0] = static_cast<uint8_t>(payload.size() & 0xff);
    block[1] = static_cast<uint8_t>((payload.size() >> 8) & 0xff);
    std::copy(payload.begin(), payload.end(), block.begin() + BLOCK_LENGTH_BYTES);

    const std::size_t padding_start = BLOCK_LENGTH_BYTES + payload.size();
    Crypto::fill_random(block.data() + padding_start, BLOCK_SIZE - padding_start);
    return block;
}

byte_vector unpack_block(const byte_vector& block) {
    if (block.size() != BLOCK_SIZE) {
        throw InvalidArgument("Block must be " + std::to_string(BLOCK_SIZE) + " bytes, got " +
                              std::to_string(block.size()));
    }

    const std::size_t length = static_cast<std::size_t>(block[0]) | (static_cast<std::size_t>(block[1]) << 8);
    if (length > BLOCK_CAPACITY) {
        throw InvalidHeader("Block length prefix " + std::to_string(length) + " exceeds block capacity.");
    }
    return byte_vector(block.begin() + BLOCK_LENGTH_BYTES, block.begin() + BLOCK_LENGTH_BYTES + length);
}

std::vector<byte_vector> split_message(const byte_vector& framed) {
    if (framed.size() > MAX_FRAMED_MESSAGE_SIZE) {
        throw MessageTooLarge("Message of " + std::to_string(framed.size()) + " bytes would span more than " +
                              std::to_string(MAX_MESSAGE_BLOCKS) + " blocks.");
    }

    std::vector<byte_vector> chunks;
    std::size_t offset = 0;
    do {
        const std::size_t len = std::min(BLOCK_CAPACITY, framed.size() - offset);
        chunks.emplace_back(framed.begin() + offset, framed.begin() + offset + len);
        offset += len;
    } while (offset < framed.size());
    return chunks;
}

// --- MessageAssembler ---

bool MessageAssembler::feed(const byte_vector& block_payload) {
    if (complete_) {
        reset();
    }

    ++blocks_;
    buffer_.insert(buffer_.end(), block_payload.begin(), block_payload.end());

    if (!have_header_) {
        if (buffer_.size() < HEADER_SIZE) {
            if (blocks_ >= MAX_MESSAGE_BLOCKS) {
                throw MessageTooLarge("No message header within " + std::to_string(blocks_) + " blocks.");
            }
            return false;
        }
        expected_ = decode_header(byte_vector(buffer_.begin(), buffer_.begin() + HEADER_SIZE));
        if (expected_ > MAX_FRAMED_MESSAGE_SIZE - HEADER_SIZE) {
            throw MessageTooLarge("Declared message length " + std::to_string(expected_) +
                                  " exceeds the spanning limit.");
        }
        have_header_ = true;
    }

    if (buffer_.size() - HEADER_SIZE >= expected_) {
        complete_ = true;
    } else if (blocks_ >= MAX_MESSAGE_BLOCKS) {
        throw MessageTooLarge("Message did not complete within " + std::to_string(blocks_) + " blocks.");
    }
    return complete_;
}

byte_vector MessageAssembler::body() const {
    if (!complete_) {
        throw LogicError("Message is not complete yet.");
    }
    return byte_vector(buffer_.begin() + HEADER_SIZE, buffer_.begin() + HEADER_SIZE + expected_);
}

void MessageAssembler::reset() {
    buffer_.clear();
    expected_ = 0;
    blocks_ = 0;
    have_header_ = false;
    complete_ = false;
}

} // namespace Numscull
