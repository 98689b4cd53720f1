#ifndef HUB_CLIENT_HUB_CLIENT_CORE_HPP
#define HUB_CLIENT_HUB_CLIENT_CORE_HPP

#include "nlohmann/json.hpp"
#include <chrono>
#include <iosfwd>
#include <string>

namespace hub_client {

/**
 * 从配置文件和环境变量得到的启动参数。
 */
struct ClientSettings {
    std::string connection_string;
    std::string hub;
    bool debug = false;
    bool verify_peer = true;
    std::chrono::seconds token_lifetime{3600};
};

/**
 * 读取JSON配置，环境变量 HUB_CLIENT_CONNECTION_STRING / HUB_CLIENT_HUB 存在时覆盖对应字段。
 * @throws nlohmann::json::exception 字段类型错误。
 * @throws std::invalid_argument 缺少连接字符串或hub名称。
 */
ClientSettings load_settings(const nlohmann::json& config);

/**
 * 项目的核心控制器。
 *
 * 负责解析连接字符串、创建SSL上下文与传输层、生成发送者标识，并运行命令循环。
 */
class HubClientCore {
public:
    explicit HubClientCore(ClientSettings settings);

    /**
     * @brief 在给定的输入输出流上运行交互循环，直到退出。
     */
    void run(std::istream& in, std::ostream& out);

private:
    ClientSettings settings_;
};

} // namespace hub_client

#endif // HUB_CLIENT_HUB_CLIENT_CORE_HPP
