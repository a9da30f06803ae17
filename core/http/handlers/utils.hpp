#pragma once

#include <httplib.h>
#include <nlohmann/json.hpp>
#include "../errors.hpp"

namespace tether
{
    namespace http
    {

        // Helper: Send JSON response
        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(body.dump(), "application/json");
        }

    } // namespace http
} // namespace tether
