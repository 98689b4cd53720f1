#include "hub_client/dispatcher.hpp"

#include <iostream>

namespace hub_client {

Dispatcher::Dispatcher(HttpTransport& transport, bool debug)
    : transport_(transport), debug_(debug) {}

Outcome Dispatcher::dispatch(const HubRequest& request) {
    beast::error_code ec;
    unsigned status = transport_.send(request, ec);

    if (ec) {
        if (debug_) std::cerr << "[Dispatcher] " << request.message.method_string() << " " << request.url
                  << " failed: " << ec.message() << std::endl;
        return Outcome::transport_failed(ec.message());
    }

    if (status != static_cast<unsigned>(http::status::accepted)) {
        if (debug_) {
            std::cout << "[Dispatcher] " << request.message.method_string() << " " << request.url
                      << " rejected with " << status << std::endl;
        }
        return Outcome::rejected(status);
    }

    if (debug_) {
        std::cout << "[Dispatcher] " << request.message.method_string() << " " << request.url
                  << " accepted" << std::endl;
    }
    return Outcome::accepted();
}

std::string describe(const Outcome& outcome) {
    switch (outcome.kind) {
    case Outcome::Kind::Accepted:
        return {};
    case Outcome::Kind::Rejected: {
        std::string text = "Sent error: " + std::to_string(outcome.status);
        auto reason = http::obsolete_reason(http::int_to_status(outcome.status));
        if (!reason.empty() && reason != "<unknown-status>") {
            text += " " + std::string(reason.data(), reason.size());
        }
        return text;
    }
    case Outcome::Kind::TransportFailed:
        return "Sent error: " + outcome.error;
    }
    return {};
}

} // namespace hub_client
