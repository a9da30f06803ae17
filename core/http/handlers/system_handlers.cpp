#include <chrono>

#include "../../runtime/lifecycle.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace tether {
namespace http {

//=============================================================================
// GET /v0/runtime/status
//=============================================================================
void HttpServer::handle_get_runtime_status(const httplib::Request &, httplib::Response &res) {
    auto now = std::chrono::steady_clock::now();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - started_at_).count();

    const auto &supervisor = lifecycle_.supervisor();
    const int pid = supervisor.pid();

    nlohmann::json sidecar_json = {{"running", supervisor.is_running()},
                                   {"mode", sidecar::launch_mode_to_string(supervisor.config().mode)}};
    sidecar_json["pid"] = pid > 0 ? nlohmann::json(pid) : nlohmann::json(nullptr);

    auto port = lifecycle_.port_registry().get();
    sidecar_json["port"] = port ? nlohmann::json(*port) : nlohmann::json(nullptr);
    sidecar_json["announcements"] = lifecycle_.port_registry().announcement_count();

    nlohmann::json response = {
        {"status", make_status(StatusCode::OK)}, {"uptime_seconds", uptime}, {"sidecar", sidecar_json}};

    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace tether
