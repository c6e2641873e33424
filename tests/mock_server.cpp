#include "mock_server.hpp"

#include <boost/asio/connect.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

#include "numscull/channel.hpp"
#include "numscull/crypto.hpp"
#include "numscull/errors.hpp"
#include "numscull/framing.hpp"
#include "numscull/handshake.hpp"

namespace fs = std::filesystem;

namespace Numscull {
namespace testing {

namespace {
constexpr std::chrono::milliseconds SERVER_IO_TIMEOUT{5000};

nlohmann::json field_or(const nlohmann::json& object, const char* key, nlohmann::json fallback) {
    auto it = object.find(key);
    return it != object.end() ? *it : fallback;
}
}

MockServer::MockServer(std::string config_dir)
    : config_dir_(std::move(config_dir)), keypair_(Crypto::generate_keypair()), acceptor_(io_context_) {}

MockServer::~MockServer() {
    stop();
}

void MockServer::start() {
    const net::Tcp::endpoint endpoint(boost::asio::ip::make_address("127.0.0.1"), 0);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::Tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();

    accept_thread_ = std::thread(&MockServer::accept_loop, this);
}

void MockServer::stop() {
    if (!accept_thread_.joinable()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stopping_ = true;
    }
    state_cv_.notify_all();

    // Wake the blocking accept with a throwaway connection.
    {
        boost::asio::io_context wake_context;
        net::Tcp::socket wake(wake_context);
        boost::system::error_code ec;
        wake.connect(net::Tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port_), ec);
        wake.close(ec);
    }
    accept_thread_.join();

    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        threads.swap(connection_threads_);
    }
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    boost::system::error_code ec;
    acceptor_.close(ec);
}

void MockServer::register_method_handler(const std::string& method, MethodHandler handler) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    handlers_[method] = std::move(handler);
}

void MockServer::set_stall(bool stall) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stall_ = stall;
    }
    state_cv_.notify_all();
}

void MockServer::drop_project(const std::string& name) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    projects_.erase(name);
}

std::vector<std::string> MockServer::project_names() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<std::string> names;
    for (const auto& [name, project] : projects_) {
        names.push_back(name);
    }
    return names;
}

std::vector<MockServer::json> MockServer::requests() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return requests_;
}

void MockServer::accept_loop() {
    while (!stopping_) {
        std::unique_ptr<net::TcpTransport> transport;
        try {
            transport = net::TcpTransport::accept(acceptor_, SERVER_IO_TIMEOUT);
        } catch (const ConnectFailed& e) {
            if (!stopping_) {
                std::cerr << "[mock-server] " << e.what() << std::endl;
            }
            continue;
        }
        if (stopping_) {
            break;
        }

        std::lock_guard<std::mutex> lock(threads_mutex_);
        connection_threads_.emplace_back(&MockServer::serve, this, std::move(transport));
    }
}

void MockServer::serve(std::unique_ptr<net::TcpTransport> transport) {
    try {
        Handshake handshake(Role::SERVER, *transport, keypair_);
        const InitRequest init = handshake.receive_init();

        const std::optional<PublicKey> client_pk = lookup_identity(init.identity);
        if (!client_pk) {
            InitResponse rejection;
            rejection.server_pk = keypair_.publicKey;
            rejection.valid = false;
            const std::string text = rejection.to_json(init.id).dump();
            transport->write(pack_plaintext(byte_vector(text.begin(), text.end())));
            return;
        }

        handshake.send_init_ack(init.id, *client_pk);
        handshake.exchange_keys();
        EncryptedChannel channel(std::move(transport), handshake.take_channel_keys());
        ++sessions_;

        std::optional<std::string> active_project;
        while (!stopping_) {
            const json message = channel.recv();
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                requests_.push_back(message);
            }

            wait_while_stalled();
            if (stopping_) {
                return;
            }

            const json response = dispatch(message, active_project);
            channel.send(response);
            if (response.value("method", "") == "control/exit") {
                return;
            }
        }
    } catch (const ConnectivityError&) {
        // Client went away.
    } catch (const std::exception& e) {
        if (!stopping_) {
            std::cerr << "[mock-server] connection error: " << e.what() << std::endl;
        }
    }
}

void MockServer::wait_while_stalled() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait(lock, [this] { return !stall_ || stopping_; });
}

MockServer::json MockServer::dispatch(const json& message, std::optional<std::string>& active_project) {
    const std::string method = message.value("method", "");
    const json params = field_or(message, "params", json::object());
    const json id = field_or(message, "id", 0);

    auto reply = [&](json result) {
        return json{{"id", id}, {"method", method}, {"result", std::move(result)}};
    };
    auto error = [&](const std::string& reason) {
        return json{{"id", id}, {"method", "control/error"}, {"result", {{"reason", reason}}}};
    };

    MethodHandler handler;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = handlers_.find(method);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }
    if (handler) {
        try {
            return reply(handler(params));
        } catch (const RemoteError& e) {
            return error(e.reason());
        }
    }

    std::lock_guard<std::mutex> lock(state_mutex_);

    if (method == "control/list/project") {
        json projects = json::array();
        for (const auto& [name, project] : projects_) {
            projects.push_back(
                {{"name", name}, {"repository", project.repository}, {"ownerIdentity", project.owner_identity}});
        }
        return reply({{"projects", projects}});
    }
    if (method == "control/create/project") {
        const std::string name = params.value("name", "");
        projects_[name] = Project{params.value("repository", ""), params.value("ownerIdentity", "")};
        return reply(json::object());
    }
    if (method == "control/change/project") {
        const std::string name = params.value("name", "");
        if (projects_.count(name) == 0) {
            return error("project not found: " + name);
        }
        active_project = name;
        return reply({{"name", name}});
    }
    if (method == "control/remove/project") {
        const std::string name = params.value("name", "");
        projects_.erase(name);
        if (active_project == name) {
            active_project.reset();
        }
        return reply(json::object());
    }
    if (method == "control/subscribe" || method == "control/unsubscribe") {
        return reply({{"channels", field_or(params, "channels", json::array())}});
    }
    if (method == "control/exit") {
        return reply(json::object());
    }

    if (!active_project || projects_.count(*active_project) == 0) {
        return error("no active project");
    }
    return error("unknown method: " + method);
}

std::optional<PublicKey> MockServer::lookup_identity(const std::string& identity) const {
    for (const fs::path& path : {fs::path(config_dir_) / "users" / (identity + ".pub"),
                                 fs::path(config_dir_) / "identities" / identity}) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            continue;
        }
        byte_vector raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (raw.size() < KEY_BYTES) {
            continue;
        }
        PublicKey pk;
        std::copy(raw.begin(), raw.begin() + KEY_BYTES, pk.data.begin());
        return pk;
    }
    return std::nullopt;
}

} // namespace testing
} // namespace Numscull
