#ifndef HUB_CLIENT_URL_HPP
#define HUB_CLIENT_URL_HPP

#include <string>
#include <string_view>

namespace hub_client {

/**
 * 绝对URL拆分后的各部分。
 *
 * target 保留原始路径与查询串，不做任何规范化。
 */
struct Url {
    bool secure = false;
    std::string host;
    std::string port;
    std::string target;
};

/**
 * 解析 http:// 或 https:// URL。
 * @throws std::invalid_argument 协议不受支持或缺少主机名。
 */
Url parse_url(std::string_view url);

} // namespace hub_client

#endif // HUB_CLIENT_URL_HPP
