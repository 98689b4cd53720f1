#include "hub_client/hub_client_core.hpp"
#include "hub_client/access_token.hpp"
#include "hub_client/command_loop.hpp"
#include "hub_client/connection_string.hpp"
#include "hub_client/dispatcher.hpp"
#include "hub_client/http_transport.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace hub_client {

ClientSettings load_settings(const nlohmann::json& config) {
    ClientSettings settings;
    settings.connection_string = config.value("connection_string", std::string{});
    settings.hub = config.value("hub", std::string{});
    settings.debug = config.value("debug", false);
    settings.verify_peer = config.value("verify_peer", true);
    settings.token_lifetime = std::chrono::seconds(config.value("token_lifetime_seconds", 3600));

    if (const char* env = std::getenv("HUB_CLIENT_CONNECTION_STRING"); env && *env) {
        settings.connection_string = env;
    }
    if (const char* env = std::getenv("HUB_CLIENT_HUB"); env && *env) {
        settings.hub = env;
    }

    if (settings.connection_string.empty()) {
        throw std::invalid_argument("Missing connection_string (config file or HUB_CLIENT_CONNECTION_STRING)");
    }
    if (settings.hub.empty()) {
        throw std::invalid_argument("Missing hub (config file or HUB_CLIENT_HUB)");
    }
    if (settings.token_lifetime.count() <= 0) {
        throw std::invalid_argument("token_lifetime_seconds must be positive");
    }
    return settings;
}

HubClientCore::HubClientCore(ClientSettings settings)
    : settings_(std::move(settings)) {}

void HubClientCore::run(std::istream& in, std::ostream& out) {
    auto const debug = settings_.debug;

    // 1. 解析连接字符串
    auto const connection = parse_connection_string(settings_.connection_string);
    HubEndpoint endpoint(connection.endpoint, settings_.hub);
    AccessTokenGenerator tokens(connection.access_key, settings_.token_lifetime);
    auto identity = SenderIdentity::generate();

    if (debug) {
        std::cout << "[Core] Endpoint: " << endpoint.base_uri() << std::endl;
        std::cout << "[Core] Hub path: " << endpoint.base_hub_path() << std::endl;
        std::cout << "[Core] Sender: " << identity.id() << std::endl;
    }

    // 2. 初始化SSL上下文与传输层，整个进程复用同一个连接
    ssl::context ctx{ssl::context::tlsv12_client};
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(settings_.verify_peer ? ssl::verify_peer : ssl::verify_none);

    BeastHttpTransport transport(ctx, debug);
    Dispatcher dispatcher(transport, debug);

    // 3. 运行命令循环
    CommandLoop loop(in, out, std::move(endpoint), std::move(identity), tokens.as_provider(), dispatcher);
    loop.run();

    if (debug) std::cout << "[Core] Shutdown complete." << std::endl;
}

} // namespace hub_client
