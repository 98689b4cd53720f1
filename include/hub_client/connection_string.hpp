#ifndef HUB_CLIENT_CONNECTION_STRING_HPP
#define HUB_CLIENT_CONNECTION_STRING_HPP

#include <string>
#include <string_view>

namespace hub_client {

/**
 * 服务连接字符串中提取出的信息。
 *
 * 格式: Endpoint=https://xxx.service.signalr.net;AccessKey=...;Version=1.0;[Port=8080;]
 * 键名大小写不敏感，Endpoint 与 AccessKey 为必填项。
 */
struct ConnectionString {
    std::string endpoint;
    std::string access_key;
    std::string version;
};

/**
 * @throws std::invalid_argument 缺少必填项或条目格式错误。
 */
ConnectionString parse_connection_string(std::string_view text);

} // namespace hub_client

#endif // HUB_CLIENT_CONNECTION_STRING_HPP
