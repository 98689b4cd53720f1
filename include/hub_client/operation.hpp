#ifndef HUB_CLIENT_OPERATION_HPP
#define HUB_CLIENT_OPERATION_HPP

#include <ostream>
#include <boost/beast/http/verb.hpp>
#include <string>
#include <variant>

namespace beast = boost::beast;
namespace http = beast::http;

namespace hub_client {

struct Broadcast {};

struct SendToUser {
    std::string user_id;
};

struct SendToGroup {
    std::string group;
};

struct AddToGroup {
    std::string group;
    std::string user_id;
};

struct RemoveFromGroup {
    std::string group;
    std::string user_id;
};

/**
 * 客户端支持的全部管理操作。封闭集合，路由时用 std::visit 穷举。
 */
using OperationKind = std::variant<Broadcast, SendToUser, SendToGroup, AddToGroup, RemoveFromGroup>;

struct Route {
    std::string path;
    http::verb method;
};

/**
 * 由操作类型与hub基础路径得到资源路径和HTTP方法。纯函数。
 *
 * AddToGroup 与 RemoveFromGroup 指向同一个资源，只是方法不同（PUT / DELETE）。
 */
Route resolve_route(const OperationKind& kind, const std::string& hub_path);

/// Broadcast / SendToUser / SendToGroup 需要携带消息体。
bool carries_payload(const OperationKind& kind);

} // namespace hub_client

#endif // HUB_CLIENT_OPERATION_HPP
