#ifndef HUB_CLIENT_ACCESS_TOKEN_HPP
#define HUB_CLIENT_ACCESS_TOKEN_HPP

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

namespace hub_client {

/**
 * 为某个资源URL签发bearer token的能力。
 * 参数依次为 (resource_url, sender_id)，返回不含 "Bearer " 前缀的token。
 */
using TokenProvider = std::function<std::string(const std::string&, const std::string&)>;

/**
 * 使用连接字符串中的AccessKey签发 HS256 JWT。
 *
 * 声明: nameid=sender_id, aud=resource_url, nbf/iat=签发时间, exp=签发时间+有效期。
 * token只对签发时的URL有效，因此每个请求都必须重新签发。
 */
class AccessTokenGenerator {
public:
    explicit AccessTokenGenerator(std::string access_key,
                                  std::chrono::seconds lifetime = std::chrono::hours(1));

    std::string generate(const std::string& audience, const std::string& sender_id) const;

    std::string generate(const std::string& audience,
                         const std::string& sender_id,
                         std::chrono::system_clock::time_point now) const;

    TokenProvider as_provider() const;

private:
    std::string access_key_;
    std::chrono::seconds lifetime_;
};

/// base64url 编码（无填充）。
std::string base64url_encode(std::string_view data);

/// HMAC-SHA256，返回原始字节。
std::string hmac_sha256(std::string_view key, std::string_view data);

} // namespace hub_client

#endif // HUB_CLIENT_ACCESS_TOKEN_HPP
