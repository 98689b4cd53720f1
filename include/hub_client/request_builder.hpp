#ifndef HUB_CLIENT_REQUEST_BUILDER_HPP
#define HUB_CLIENT_REQUEST_BUILDER_HPP

#include "hub_client/access_token.hpp"
#include "hub_client/operation.hpp"
#include "hub_client/url.hpp"
#include "nlohmann/json.hpp"

#include <boost/beast/http.hpp>
#include <optional>
#include <string>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;

namespace hub_client {

/**
 * 发送类操作的消息体: {"target": "...", "arguments": [...]}
 */
struct PayloadMessage {
    std::string target;
    std::vector<nlohmann::json> arguments;
};

void to_json(nlohmann::json& j, const PayloadMessage& msg);

/// 本客户端固定使用的演示消息。
PayloadMessage default_payload(const std::string& sender_id);

/**
 * 进程内唯一的发送者标识: {主机名}_{32位十六进制随机串}。
 */
class SenderIdentity {
public:
    explicit SenderIdentity(std::string id) : id_(std::move(id)) {}

    static SenderIdentity generate();

    const std::string& id() const { return id_; }

private:
    std::string id_;
};

/**
 * 一个待发送的请求，url 保存资源的完整地址，message 是线上格式的HTTP报文。
 */
struct HubRequest {
    std::string url;
    Url target;
    http::request<http::string_body> message;
};

/**
 * 构造带认证的HTTP请求。
 *
 * 每次调用都会为 route.path 重新签发token，不缓存、不复用。
 * 仅当传入 payload 时才附加JSON消息体。
 */
HubRequest build_request(const Route& route,
                         const SenderIdentity& identity,
                         const TokenProvider& token_provider,
                         const std::optional<PayloadMessage>& payload);

/// 按操作类型决定是否附加 default_payload。
HubRequest build_request(const OperationKind& kind,
                         const std::string& hub_path,
                         const SenderIdentity& identity,
                         const TokenProvider& token_provider);

} // namespace hub_client

#endif // HUB_CLIENT_REQUEST_BUILDER_HPP
