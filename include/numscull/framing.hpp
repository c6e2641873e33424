#ifndef NUMSCULL_FRAMING_HPP
#define NUMSCULL_FRAMING_HPP

#include "crypto.hpp"
#include "keys.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Numscull {

    class Transport;

    // Plaintext length header: 10 ASCII decimal digits, zero padded.
    constexpr std::size_t HEADER_SIZE = 10;
    constexpr std::size_t BLOCK_SIZE = 512;
    constexpr std::size_t BLOCK_LENGTH_BYTES = 2;
    constexpr std::size_t BLOCK_CAPACITY = BLOCK_SIZE - BLOCK_LENGTH_BYTES;  // 510
    constexpr std::size_t ENCRYPTED_BLOCK_SIZE = BLOCK_SIZE + MAC_BYTES;     // 528

    // Upper bound on the number of blocks one logical message may span.
    constexpr std::size_t MAX_MESSAGE_BLOCKS = 2048;
    constexpr std::size_t MAX_FRAMED_MESSAGE_SIZE = MAX_MESSAGE_BLOCKS * BLOCK_CAPACITY;

    /**
     * @brief Formats a payload length as the 10-byte decimal header.
     * @throws MessageTooLarge if the length needs more than 10 digits.
     */
    std::string encode_header(std::size_t length);

    /**
     * @brief Parses a 10-byte decimal header.
     *
     * Surrounding ASCII whitespace and a leading '+' are tolerated.
     * @throws InvalidHeader if the header is not exactly 10 bytes, not numeric, or negative.
     */
    std::size_t decode_header(const byte_vector& header);

    // [10-byte header][payload]
    byte_vector pack_plaintext(const byte_vector& payload);

    /**
     * @brief Reads one plaintext envelope: exactly 10 header bytes, then exactly N bytes.
     */
    byte_vector read_plaintext(Transport& transport);

    /**
     * @brief Builds the 512-byte plaintext of an encrypted block:
     * [u16 LE length][payload][random padding].
     * @throws MessageTooLarge if the payload exceeds BLOCK_CAPACITY.
     */
    byte_vector pack_block(const byte_vector& payload);

    /**
     * @brief Extracts the payload of a decrypted block. Padding is ignored.
     * @throws InvalidArgument if the block is not BLOCK_SIZE bytes.
     * @throws InvalidHeader if the length prefix exceeds BLOCK_CAPACITY.
     */
    byte_vector unpack_block(const byte_vector& block);

    /**
     * @brief Cuts a framed message into consecutive block payloads of at most
     * BLOCK_CAPACITY bytes. An empty message still occupies one block.
     * @throws MessageTooLarge above MAX_MESSAGE_BLOCKS blocks.
     */
    std::vector<byte_vector> split_message(const byte_vector& framed);

    /**
     * @brief Reassembles a [header][body] message from block payloads.
     */
    class MessageAssembler {
    public:
        /**
         * @brief Appends one block payload.
         * @return true once the declared body length has been received.
         * @throws InvalidHeader if the header does not parse.
         * @throws MessageTooLarge if the declared length is beyond the spanning limit.
         */
        bool feed(const byte_vector& block_payload);

        bool complete() const { return complete_; }
        std::size_t blocks() const { return blocks_; }

        /**
         * @brief The message body (without header). Only valid once complete().
         * Bytes past the declared length are dropped.
         */
        byte_vector body() const;

        void reset();

    private:
        byte_vector buffer_;
        std::size_t expected_ = 0;
        std::size_t blocks_ = 0;
        bool have_header_ = false;
        bool complete_ = false;
    };

} // namespace Numscull

#endif // NUMSCULL_FRAMING_HPP
