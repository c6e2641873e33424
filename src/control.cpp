#include "numscull/control.hpp"

#include "numscull/crypto.hpp"

namespace Numscull {
namespace control {

json list_projects(Client& client) {
    return client.request("control/list/project");
}

json create_project(Client& client,
                    const std::string& name,
                    const std::string& repository,
                    const std::string& owner_identity) {
    return client.request("control/create/project",
                          {{"name", name}, {"repository", repository}, {"ownerIdentity", owner_identity}});
}

json change_project(Client& client, const std::string& name) {
    return client.request("control/change/project", {{"name", name}});
}

json remove_project(Client& client, const std::string& name) {
    return client.request("control/remove/project", {{"name", name}});
}

json subscribe(Client& client, const std::vector<int64_t>& channels) {
    return client.request("control/subscribe", {{"channels", channels}});
}

json unsubscribe(Client& client, const std::vector<int64_t>& channels) {
    return client.request("control/unsubscribe", {{"channels", channels}});
}

json add_user_server(Client& client, const std::string& identity, const PublicKey& public_key) {
    const byte_vector key(public_key.data.begin(), public_key.data.end());
    return client.request("control/add/user/server",
                          {{"identity", identity}, {"publicKey", {{"bytes", Crypto::base64_encode(key)}}}});
}

json add_user_project(Client& client,
                      const std::string& project,
                      const std::string& identity,
                      const std::optional<json>& permissions) {
    json params = {{"project", project}, {"identity", identity}};
    if (permissions) {
        params["permissions"] = *permissions;
    }
    return client.request("control/add/user/project", params);
}

json exit(Client& client) {
    struct CloseOnExit {
        Client& client;
        ~CloseOnExit() { client.close(); }
    } guard{client};
    return client.request("control/exit");
}

} // namespace control
} // namespace Numscull
