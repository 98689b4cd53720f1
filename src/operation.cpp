#include "hub_client/operation.hpp"

namespace hub_client {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

Route resolve_route(const OperationKind& kind, const std::string& hub_path) {
    return std::visit(overloaded{
        [&](const Broadcast&) {
            return Route{hub_path, http::verb::post};
        },
        [&](const SendToUser& op) {
            return Route{hub_path + "/users/" + op.user_id, http::verb::post};
        },
        [&](const SendToGroup& op) {
            return Route{hub_path + "/groups/" + op.group, http::verb::post};
        },
        [&](const AddToGroup& op) {
            return Route{hub_path + "/groups/" + op.group + "/users/" + op.user_id, http::verb::put};
        },
        [&](const RemoveFromGroup& op) {
            return Route{hub_path + "/groups/" + op.group + "/users/" + op.user_id, http::verb::delete_};
        },
    }, kind);
}

bool carries_payload(const OperationKind& kind) {
    return std::holds_alternative<Broadcast>(kind)
        || std::holds_alternative<SendToUser>(kind)
        || std::holds_alternative<SendToGroup>(kind);
}

} // namespace hub_client
