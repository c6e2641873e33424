#ifndef NUMSCULL_CLIENT_HPP
#define NUMSCULL_CLIENT_HPP

#include "channel.hpp"
#include "config.hpp"
#include "keys.hpp"
#include "transport.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace Numscull {

    constexpr char ERROR_METHOD[] = "control/error";

    /**
     * @brief A request/response session over one encrypted channel.
     *
     * The protocol does not pipeline: each request is followed by exactly one
     * response before the next request goes out, so the next message received
     * is taken as the answer. Message ids are sent but responses are not
     * matched against them.
     *
     * Independent sessions can run concurrently; a single Client cannot.
     */
    class Client {
    public:
        using json = nlohmann::json;

        /**
         * @brief Connects, runs the handshake and returns a ready session.
         *
         * The identity key pair is loaded from config.config_dir.
         */
        static std::unique_ptr<Client> connect_and_handshake(const ClientConfig& config);

        static std::unique_ptr<Client> connect_and_handshake(const std::string& host,
                                                             uint16_t port,
                                                             const std::string& identity,
                                                             const std::string& config_dir);

        /**
         * @brief Runs the handshake over an already open transport.
         *
         * On failure the transport is closed before the exception propagates.
         */
        static std::unique_ptr<Client> handshake(std::unique_ptr<Transport> transport,
                                                 const KeyPair& identity_keys,
                                                 const ClientConfig& config);

        ~Client();

        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;

        /**
         * @brief Sends a request and returns its result object.
         * @throws RemoteError if the server answers with control/error.
         * @throws TransportClosed if the session is already closed.
         */
        json request(const std::string& method, const json& params = json::object());

        /**
         * @brief Sends a request and returns the whole response envelope, error envelopes included.
         */
        json send_raw(const std::string& method, const json& params = json::object());

        // Idempotent.
        void close();
        bool is_connected() const;

        const json& init_response() const { return init_response_; }
        uint64_t next_message_id() const { return next_id_; }
        EncryptedChannel& channel() { return *channel_; }

    private:
        Client(std::unique_ptr<EncryptedChannel> channel, json init_response, uint64_t next_id, bool verbose);

        std::unique_ptr<EncryptedChannel> channel_;
        json init_response_;
        uint64_t next_id_;
        bool verbose_;
    };

    // Session-level entry points.
    nlohmann::json request(Client& client, const std::string& method, const nlohmann::json& params = nlohmann::json::object());
    void close(Client& client);

} // namespace Numscull

#endif // NUMSCULL_CLIENT_HPP
