#ifndef HUB_CLIENT_HTTP_TRANSPORT_HPP
#define HUB_CLIENT_HTTP_TRANSPORT_HPP

#include "hub_client/request_builder.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace hub_client {

/**
 * 发送一个请求并只读取响应头。
 *
 * 成功时返回HTTP状态码；出错时设置 ec，返回值无意义。
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual unsigned send(const HubRequest& request, beast::error_code& ec) = 0;
};

/**
 * 基于 Beast 的HTTP/HTTPS传输实现。
 *
 * 在同一个 io_context 上依次完成 resolve -> connect -> (ssl handshake) -> write -> read header，
 * 每次 send 都把 io_context 跑到完成为止。连接在请求之间保持复用（keep-alive），
 * 目标主机变化、服务端要求关闭、响应带有未读取的body或任何错误发生时连接都会被关闭。
 * 复用前先检查对端是否已在空闲期间关闭连接，若已关闭则重新建立连接。
 */
class BeastHttpTransport : public HttpTransport {
public:
    BeastHttpTransport(ssl::context& ctx, bool debug,
                       std::chrono::seconds io_timeout = std::chrono::seconds(30));
    ~BeastHttpTransport() override;

    unsigned send(const HubRequest& request, beast::error_code& ec) override;

    /// 当前是否持有可复用的连接。
    bool connected() const;

private:
    class Operation;

    /// 空闲连接是否仍可用：对端已关闭或有未预期的数据到达都视为不可用。
    bool peer_alive();
    void close();

    net::io_context ioc_;
    ssl::context& ctx_;
    bool debug_;
    std::chrono::seconds io_timeout_;

    std::string host_;
    std::string port_;
    bool secure_ = false;
    std::unique_ptr<beast::tcp_stream> plain_stream_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> ssl_stream_;
};

} // namespace hub_client

#endif // HUB_CLIENT_HTTP_TRANSPORT_HPP
