#include "numscull/client.hpp"

#include <iostream>

#include "numscull/crypto.hpp"
#include "numscull/errors.hpp"
#include "numscull/handshake.hpp"
#include "numscull/tcp_transport.hpp"

namespace Numscull {

std::unique_ptr<Client> Client::connect_and_handshake(const ClientConfig& config) {
    if (Crypto::init() != 0) {
        throw RuntimeError("Failed to initialize crypto library.");
    }
    if (config.identity.empty()) {
        throw InvalidArgument("An identity is required.");
    }
    if (config.config_dir.empty()) {
        throw InvalidArgument("config_dir is required to locate identities/" + config.identity);
    }

    // Identity problems are reported before any connection is attempted.
    const KeyPair identity_keys = Crypto::load_keypair(config.identity, config.config_dir);

    if (config.verbose) {
        std::cerr << "[numscull] connecting to " << config.host << ":" << config.port << " as " << config.identity
                  << std::endl;
    }
    std::unique_ptr<Transport> transport = net::TcpTransport::connect(config.host, config.port, config.io_timeout);
    return handshake(std::move(transport), identity_keys, config);
}

std::unique_ptr<Client> Client::connect_and_handshake(const std::string& host,
                                                      uint16_t port,
                                                      const std::string& identity,
                                                      const std::string& config_dir) {
    ClientConfig config;
    config.host = host;
    config.port = port;
    config.identity = identity;
    config.config_dir = config_dir;
    return connect_and_handshake(config);
}

std::unique_ptr<Client> Client::handshake(std::unique_ptr<Transport> transport,
                                          const KeyPair& identity_keys,
                                          const ClientConfig& config) {
    if (!transport) {
        throw InvalidArgument("handshake requires a transport.");
    }

    uint64_t next_id = 1;
    json init_response;
    ChannelKeys keys;
    try {
        Handshake handshake(Role::CLIENT, *transport, identity_keys);

        handshake.send_init(InitRequest{config.identity, config.version, next_id});
        ++next_id;
        if (config.verbose) {
            std::cerr << "[numscull] control/init sent (version " << config.version << ")" << std::endl;
        }

        const InitResponse& ack = handshake.receive_init_ack();
        init_response = ack.message;
        if (config.verbose) {
            std::cerr << "[numscull] server key received" << std::endl;
        }

        handshake.exchange_keys();
        keys = handshake.take_channel_keys();
        if (config.verbose) {
            std::cerr << "[numscull] ephemeral keys exchanged, channel ready" << std::endl;
        }
    } catch (const std::exception& e) {
        if (config.verbose) {
            std::cerr << "[numscull] handshake failed: " << e.what() << std::endl;
        }
        transport->close();
        throw;
    }

    auto channel = std::make_unique<EncryptedChannel>(std::move(transport), std::move(keys));
    return std::unique_ptr<Client>(new Client(std::move(channel), std::move(init_response), next_id, config.verbose));
}

Client::Client(std::unique_ptr<EncryptedChannel> channel, json init_response, uint64_t next_id, bool verbose)
    : channel_(std::move(channel)), init_response_(std::move(init_response)), next_id_(next_id), verbose_(verbose) {}

Client::~Client() {
    close();
}

Client::json Client::request(const std::string& method, const json& params) {
    json response = send_raw(method, params);

    auto method_field = response.find("method");
    if (method_field != response.end() && method_field->is_string() && *method_field == ERROR_METHOD) {
        std::string reason = "unknown error";
        auto result = response.find("result");
        if (result != response.end() && result->is_object()) {
            auto it = result->find("reason");
            if (it != result->end() && it->is_string()) {
                reason = it->get<std::string>();
            }
        }
        if (verbose_) {
            std::cerr << "[numscull] " << method << " rejected: " << reason << std::endl;
        }
        throw RemoteError(reason);
    }

    for (const char* field : {"result", "params"}) {
        auto it = response.find(field);
        if (it != response.end() && !it->is_null()) {
            return *it;
        }
    }
    return response;
}

Client::json Client::send_raw(const std::string& method, const json& params) {
    if (!is_connected()) {
        throw TransportClosed("Client is not connected.");
    }

    const uint64_t id = next_id_++;
    if (verbose_) {
        std::cerr << "[numscull] -> " << method << " (id " << id << ")" << std::endl;
    }

    channel_->send(json{{"id", id}, {"method", method}, {"params", params.is_null() ? json::object() : params}});
    json response = channel_->recv();

    if (!response.is_object()) {
        channel_->close();
        throw RuntimeError("Response to " + method + " is not a JSON object.");
    }
    return response;
}

void Client::close() {
    if (channel_) {
        channel_->close();
    }
}

bool Client::is_connected() const {
    return channel_ && channel_->is_open();
}

nlohmann::json request(Client& client, const std::string& method, const nlohmann::json& params) {
    return client.request(method, params);
}

void close(Client& client) {
    client.close();
}

} // namespace Numscull
