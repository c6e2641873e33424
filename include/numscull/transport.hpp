#ifndef NUMSCULL_TRANSPORT_HPP
#define NUMSCULL_TRANSPORT_HPP

#include "keys.hpp"

#include <cstddef>

namespace Numscull {

    /**
     * @brief Blocking byte-stream interface the protocol layers are written against.
     *
     * Implementations never return short reads and never leave a write half done.
     * Once an operation fails fatally the transport is closed and every later
     * call throws TransportClosed.
     */
    class Transport {
    public:
        virtual ~Transport() = default;

        /**
         * @brief Reads exactly n bytes.
         * @throws ConnectionClosed if the peer closes first.
         * @throws ReadTimeout if the configured deadline elapses first.
         * @throws TransportClosed if the transport is already closed.
         */
        virtual byte_vector read(std::size_t n) = 0;

        /**
         * @brief Writes all bytes before returning.
         * @throws WriteFailed on any error.
         * @throws TransportClosed if the transport is already closed.
         */
        virtual void write(const byte_vector& data) = 0;

        // Idempotent.
        virtual void close() = 0;

        virtual bool is_open() const = 0;
    };

} // namespace Numscull

#endif // NUMSCULL_TRANSPORT_HPP
