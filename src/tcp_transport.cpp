#include "numscull/tcp_transport.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <iostream>

#include "numscull/errors.hpp"

namespace Numscull {
    namespace net {

        TcpTransport::TcpTransport(std::chrono::milliseconds timeout)
            : socket_(io_context_), timeout_(timeout) {}

        TcpTransport::~TcpTransport() {
            close();
        }

        std::unique_ptr<TcpTransport> TcpTransport::connect(const std::string& host,
                                                            uint16_t port,
                                                            std::chrono::milliseconds timeout) {
            auto transport = std::make_unique<TcpTransport>(timeout);
            transport->open(host, port);
            return transport;
        }

        std::unique_ptr<TcpTransport> TcpTransport::accept(Tcp::acceptor& acceptor, std::chrono::milliseconds timeout) {
            auto transport = std::make_unique<TcpTransport>(timeout);
            boost::system::error_code ec;
            acceptor.accept(transport->socket_, ec);
            if (ec) {
                throw ConnectFailed("Accept failed: " + ec.message());
            }
            transport->socket_.set_option(Tcp::no_delay(true), ec);
            return transport;
        }

        void TcpTransport::open(const std::string& host, uint16_t port) {
            Tcp::resolver resolver(io_context_);
            boost::system::error_code ec;
            auto endpoints = resolver.resolve(host, std::to_string(port), ec);
            if (ec) {
                closed_ = true;
                throw ConnectFailed("Could not resolve " + host + ": " + ec.message());
            }

            boost::system::error_code error = boost::asio::error::would_block;
            boost::asio::async_connect(socket_, endpoints,
                                       [&](const boost::system::error_code& result_error, const Tcp::endpoint&) {
                                           error = result_error;
                                       });

            const std::string where = host + ":" + std::to_string(port);
            if (run()) {
                close();
                throw ConnectFailed("Timed out connecting to " + where);
            }
            if (error == boost::asio::error::connection_refused) {
                close();
                throw ConnectionRefused("Connection refused by " + where);
            }
            if (error) {
                close();
                throw ConnectFailed("Could not connect to " + where + ": " + error.message());
            }

            socket_.set_option(Tcp::no_delay(true), ec);
        }

        byte_vector TcpTransport::read(std::size_t n) {
            ensure_open();

            if (input_buffer_.size() < n) {
                const std::size_t needed = n - input_buffer_.size();
                boost::system::error_code error = boost::asio::error::would_block;
                boost::asio::async_read(socket_,
                                        boost::asio::dynamic_buffer(input_buffer_),
                                        boost::asio::transfer_at_least(needed),
                                        [&](const boost::system::error_code& result_error, std::size_t) {
                                            error = result_error;
                                        });

                if (run()) {
                    close();
                    throw ReadTimeout("Timed out after " + std::to_string(timeout_.count()) + "ms waiting for " +
                                      std::to_string(n) + " bytes");
                }
                if (error == boost::asio::error::eof) {
                    const std::size_t received = input_buffer_.size();
                    close();
                    throw ConnectionClosed("Peer closed the connection after " + std::to_string(received) + " of " +
                                           std::to_string(n) + " bytes");
                }
                if (error) {
                    close();
                    throw ConnectionClosed("Read failed: " + error.message());
                }
            }

            byte_vector out(input_buffer_.begin(), input_buffer_.begin() + n);
            input_buffer_.erase(input_buffer_.begin(), input_buffer_.begin() + n);
            return out;
        }

        void TcpTransport::write(const byte_vector& data) {
            ensure_open();

            boost::system::error_code error = boost::asio::error::would_block;
            // async_write keeps issuing writes until the whole buffer is flushed.
            boost::asio::async_write(socket_,
                                     boost::asio::buffer(data),
                                     [&](const boost::system::error_code& result_error, std::size_t) {
                                         error = result_error;
                                     });

            if (run()) {
                close();
                throw WriteFailed("Timed out writing " + std::to_string(data.size()) + " bytes");
            }
            if (error) {
                close();
                throw WriteFailed("Write failed: " + error.message());
            }
        }

        void TcpTransport::close() {
            if (closed_) {
                return;
            }
            closed_ = true;
            input_buffer_.clear();

            if (socket_.is_open()) {
                boost::system::error_code ec;
                socket_.shutdown(Tcp::socket::shutdown_both, ec);
                socket_.close(ec);
                if (ec) {
                    std::cerr << "Error closing socket: " << ec.message() << std::endl;
                }
            }
        }

        bool TcpTransport::is_open() const {
            return !closed_ && socket_.is_open();
        }

        void TcpTransport::ensure_open() const {
            if (!is_open()) {
                throw TransportClosed("Transport is closed.");
            }
        }

        bool TcpTransport::run() {
            io_context_.restart();

            if (timeout_ == std::chrono::milliseconds::zero()) {
                io_context_.run();
                return false;
            }

            io_context_.run_for(timeout_);
            if (io_context_.stopped()) {
                return false;
            }

            // The operation is still pending. Closing the socket makes it complete
            // with operation_aborted, then drain the handler.
            boost::system::error_code ignored;
            socket_.close(ignored);
            io_context_.run();
            return true;
        }

    }  // namespace net
}  // namespace Numscull
