#include "rro/host_environment.hpp"
#include "rro/platform.hpp"

#include <algorithm>
#include <cstring>
#include <memory>
#include <mutex>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace rro {

namespace {

// Evaluate `predicate` on first use only
std::function<bool()> evaluate_once(std::function<bool()> predicate) {
    struct State {
        std::once_flag once;
        bool value = false;
    };
    auto state = std::make_shared<State>();
    return [state, predicate = std::move(predicate)]() {
        std::call_once(state->once, [&] { state->value = predicate(); });
        return state->value;
    };
}

} // namespace

bool probe_unix_socket(const std::string& path) {
    sockaddr_un addr{};
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        return false;
    }

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        return false;
    }

    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size());

    bool connected = connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    close(fd);
    return connected;
}

Environment make_host_environment(const EnvironmentConfig& config) {
    Environment env;
    env.platform = config.platform;

    std::string socket_path = config.companion_socket;
    env.companion_service_reachable = evaluate_once([socket_path] {
        return !socket_path.empty() && path_exists(socket_path);
    });
    env.companion_service_initialize = [socket_path] {
        bool ok = probe_unix_socket(socket_path);
        if (!ok) {
            spdlog::debug("Companion service at {} did not accept a connection", socket_path);
        }
        return ok;
    };

    std::string bridge = config.system_service_path;
    env.system_service_bridge_present = evaluate_once([bridge] {
        return !bridge.empty() && path_exists(bridge);
    });

    std::string search_path = config.search_path;
    env.root_available = [search_path] {
        return search_path.empty() ? is_root_available() : is_root_available(search_path);
    };

    std::string app = config.companion_app_path;
    env.companion_app_installed = [app] {
        return !app.empty() && path_exists(app);
    };

    auto granted = config.granted_permissions;
    env.permission_granted = [granted](const std::string& permission) {
        return std::find(granted.begin(), granted.end(), permission) != granted.end();
    };

    env.make_backend = default_backend_factory();
    return env;
}

} // namespace rro
