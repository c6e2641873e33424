#ifndef NUMSCULL_TCP_TRANSPORT_HPP
#define NUMSCULL_TCP_TRANSPORT_HPP

#include "transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace Numscull {
namespace net {

    using Tcp = boost::asio::ip::tcp;

/**
 * @brief Transport over a TCP socket.
 *
 * Every operation is started asynchronously on a private io_context which is
 * then run until the operation completes or the deadline expires. A zero
 * timeout waits forever.
 */
class TcpTransport : public Transport {
public:
    explicit TcpTransport(std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());
    ~TcpTransport() override;

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    /**
     * @brief Resolves host and connects.
     * @throws ConnectionRefused if the peer actively refused.
     * @throws ConnectFailed for resolution failures, timeouts and other errors.
     */
    static std::unique_ptr<TcpTransport> connect(const std::string& host,
                                                 uint16_t port,
                                                 std::chrono::milliseconds timeout);

    /**
     * @brief Blocks until the acceptor yields a connection (server side).
     */
    static std::unique_ptr<TcpTransport> accept(Tcp::acceptor& acceptor, std::chrono::milliseconds timeout);

    byte_vector read(std::size_t n) override;
    void write(const byte_vector& data) override;
    void close() override;
    bool is_open() const override;

    std::chrono::milliseconds timeout() const { return timeout_; }
    void set_timeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

private:
    void open(const std::string& host, uint16_t port);
    void ensure_open() const;
    // Returns true if the deadline expired before the pending operation finished.
    bool run();

    boost::asio::io_context io_context_;
    Tcp::socket socket_;
    std::chrono::milliseconds timeout_;
    byte_vector input_buffer_;
    bool closed_ = false;
};

} // namespace net
} // namespace Numscull

#endif // NUMSCULL_TCP_TRANSPORT_HPP
