#include "hub_client/request_builder.hpp"

#include <boost/asio/ip/host_name.hpp>
#include <boost/beast/version.hpp>
#include <openssl/rand.h>

#include <stdexcept>

namespace hub_client {

void to_json(nlohmann::json& j, const PayloadMessage& msg) {
    j = nlohmann::json{{"target", msg.target}, {"arguments", msg.arguments}};
}

PayloadMessage default_payload(const std::string& sender_id) {
    return PayloadMessage{"SendMessage", {sender_id, "Hello from server"}};
}

SenderIdentity SenderIdentity::generate() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating sender identity");
    }
    static const char* hex = "0123456789abcdef";
    std::string suffix;
    suffix.reserve(sizeof(bytes) * 2);
    for (unsigned char b : bytes) {
        suffix.push_back(hex[b >> 4]);
        suffix.push_back(hex[b & 0x0F]);
    }
    return SenderIdentity(boost::asio::ip::host_name() + "_" + suffix);
}

HubRequest build_request(const Route& route,
                         const SenderIdentity& identity,
                         const TokenProvider& token_provider,
                         const std::optional<PayloadMessage>& payload) {
    HubRequest request;
    request.url = route.path;
    request.target = parse_url(route.path);

    auto& msg = request.message;
    msg.version(11);
    msg.method(route.method);
    msg.target(request.target.target);
    auto const& t = request.target;
    bool const default_port = (t.secure && t.port == "443") || (!t.secure && t.port == "80");
    msg.set(http::field::host, default_port ? t.host : t.host + ":" + t.port);
    msg.set(http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " hub-client");
    msg.set(http::field::authorization, "Bearer " + token_provider(route.path, identity.id()));
    msg.set(http::field::accept, "application/json");

    if (payload) {
        msg.set(http::field::content_type, "application/json; charset=utf-8");
        msg.body() = nlohmann::json(*payload).dump();
    }
    msg.prepare_payload();
    return request;
}

HubRequest build_request(const OperationKind& kind,
                         const std::string& hub_path,
                         const SenderIdentity& identity,
                         const TokenProvider& token_provider) {
    std::optional<PayloadMessage> payload;
    if (carries_payload(kind)) {
        payload = default_payload(identity.id());
    }
    return build_request(resolve_route(kind, hub_path), identity, token_provider, payload);
}

} // namespace hub_client
