#include "../../logging/logger.hpp"
#include "../../runtime/lifecycle.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace tether {
namespace http {

//=============================================================================
// GET /v0/sidecar/port
//=============================================================================
void HttpServer::handle_get_port(const httplib::Request &, httplib::Response &res) {
    uint16_t port = 0;
    std::string error;
    if (!lifecycle_.get_discovered_port(port, error)) {
        send_json(res, StatusCode::UNAVAILABLE, make_error_response(StatusCode::UNAVAILABLE, error));
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"port", port}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /v0/sidecar/kill
//=============================================================================
void HttpServer::handle_post_kill(const httplib::Request &, httplib::Response &res) {
    LOG_INFO("[HTTP] Kill requested by client");

    std::string error;
    if (!lifecycle_.force_kill_sidecar(error)) {
        send_json(res, StatusCode::INTERNAL, make_error_response(StatusCode::INTERNAL, error));
        return;
    }

    send_json(res, StatusCode::OK, {{"status", make_status(StatusCode::OK)}});
}

}  // namespace http
}  // namespace tether
