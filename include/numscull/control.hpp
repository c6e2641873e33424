#ifndef NUMSCULL_CONTROL_HPP
#define NUMSCULL_CONTROL_HPP

#include "client.hpp"
#include "keys.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Numscull {
namespace control {

    using json = nlohmann::json;

    // control/list/project -> {"projects": [...]}
    json list_projects(Client& client);

    json create_project(Client& client,
                        const std::string& name,
                        const std::string& repository,
                        const std::string& owner_identity);

    // Makes name the active project for this session.
    json change_project(Client& client, const std::string& name);

    json remove_project(Client& client, const std::string& name);

    json subscribe(Client& client, const std::vector<int64_t>& channels);
    json unsubscribe(Client& client, const std::vector<int64_t>& channels);

    // Registers a user with the server; the key travels base64 encoded.
    json add_user_server(Client& client, const std::string& identity, const PublicKey& public_key);

    json add_user_project(Client& client,
                          const std::string& project,
                          const std::string& identity,
                          const std::optional<json>& permissions = std::nullopt);

    /**
     * @brief Sends control/exit, then closes the client whatever the outcome.
     */
    json exit(Client& client);

} // namespace control
} // namespace Numscull

#endif // NUMSCULL_CONTROL_HPP
