#ifndef HUB_CLIENT_HUB_ENDPOINT_HPP
#define HUB_CLIENT_HUB_ENDPOINT_HPP

#include <string>

namespace hub_client {

/**
 * 服务地址与hub名称，启动时构造一次，之后不再修改。
 * hub名称在构造时统一转为小写，服务端对hub名大小写不敏感。
 */
class HubEndpoint {
public:
    HubEndpoint(std::string base_uri, std::string hub_name);

    const std::string& base_uri() const { return base_uri_; }
    const std::string& hub_name() const { return hub_name_; }

    /// {base_uri}/api/v1/hubs/{hub_name}
    std::string base_hub_path() const;

private:
    std::string base_uri_;
    std::string hub_name_;
};

std::string base_hub_path(const std::string& endpoint, const std::string& hub_name);

} // namespace hub_client

#endif // HUB_CLIENT_HUB_ENDPOINT_HPP
