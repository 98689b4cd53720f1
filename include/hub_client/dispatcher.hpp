#ifndef HUB_CLIENT_DISPATCHER_HPP
#define HUB_CLIENT_DISPATCHER_HPP

#include "hub_client/http_transport.hpp"
#include "hub_client/request_builder.hpp"

#include <string>

namespace hub_client {

/**
 * 一次请求的结果。只有 202 Accepted 视为成功。
 */
struct Outcome {
    enum class Kind { Accepted, Rejected, TransportFailed };

    Kind kind;
    unsigned status = 0;
    std::string error;

    static Outcome accepted() { return {Kind::Accepted, 202, {}}; }
    static Outcome rejected(unsigned status) { return {Kind::Rejected, status, {}}; }
    static Outcome transport_failed(std::string error) { return {Kind::TransportFailed, 0, std::move(error)}; }

    bool ok() const { return kind == Kind::Accepted; }
};

/**
 * 通过注入的传输层发送请求并对状态码分类。
 *
 * 传输层实例由调用方持有并在多次请求间复用；Dispatcher 本身不保存状态。
 */
class Dispatcher {
public:
    Dispatcher(HttpTransport& transport, bool debug);

    Outcome dispatch(const HubRequest& request);

private:
    HttpTransport& transport_;
    bool debug_;
};

/// 给用户看的一行结果描述，成功时为空串。
std::string describe(const Outcome& outcome);

} // namespace hub_client

#endif // HUB_CLIENT_DISPATCHER_HPP
