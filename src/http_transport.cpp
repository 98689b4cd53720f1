#include "hub_client/http_transport.hpp"

#include <iostream>

namespace hub_client {

/**
 * 单次请求的异步状态机，生命周期由回调链中的 shared_ptr 维持。
 */
class BeastHttpTransport::Operation : public std::enable_shared_from_this<BeastHttpTransport::Operation> {
public:
    Operation(BeastHttpTransport& transport, const HubRequest& request, beast::error_code& ec, unsigned& status)
        : transport_(transport),
          request_(request),
          resolver_(transport.ioc_),
          ec_(ec),
          status_(status) {}

    http::response_parser<http::empty_body>& parser() { return parser_; }

    void run() {
        if (transport_.connected()) {
            if (transport_.peer_alive()) {
                if (transport_.debug_) std::cout << "[Transport] Reusing connection to " << transport_.host_ << std::endl;
                return do_write();
            }
            if (transport_.debug_) std::cout << "[Transport] Idle connection to " << transport_.host_ << " was closed by peer, reconnecting" << std::endl;
        }

        transport_.close();

        auto const& target = request_.target;
        transport_.host_ = target.host;
        transport_.port_ = target.port;
        transport_.secure_ = target.secure;
        if (target.secure) {
            transport_.ssl_stream_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(transport_.ioc_, transport_.ctx_);
            // 设置SNI主机名，这对于SSL非常重要
            if (!SSL_set_tlsext_host_name(transport_.ssl_stream_->native_handle(), target.host.c_str())) {
                beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                return fail(ec, "ssl_sni");
            }
        } else {
            transport_.plain_stream_ = std::make_unique<beast::tcp_stream>(transport_.ioc_);
        }

        resolver_.async_resolve(
            target.host,
            target.port,
            beast::bind_front_handler(&Operation::on_resolve, shared_from_this()));
    }

private:
    beast::tcp_stream& lowest_layer() {
        if (transport_.secure_) return beast::get_lowest_layer(*transport_.ssl_stream_);
        return *transport_.plain_stream_;
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail(ec, "resolve");

        lowest_layer().expires_after(transport_.io_timeout_);
        lowest_layer().async_connect(
            results,
            beast::bind_front_handler(&Operation::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) return fail(ec, "connect");

        if (!transport_.secure_) return do_write();

        lowest_layer().expires_after(transport_.io_timeout_);
        transport_.ssl_stream_->async_handshake(
            ssl::stream_base::client,
            beast::bind_front_handler(&Operation::on_ssl_handshake, shared_from_this()));
    }

    void on_ssl_handshake(beast::error_code ec) {
        if (ec) return fail(ec, "ssl_handshake");
        do_write();
    }

    void do_write() {
        lowest_layer().expires_after(transport_.io_timeout_);
        if (transport_.secure_) {
            http::async_write(*transport_.ssl_stream_, request_.message,
                beast::bind_front_handler(&Operation::on_write, shared_from_this()));
        } else {
            http::async_write(*transport_.plain_stream_, request_.message,
                beast::bind_front_handler(&Operation::on_write, shared_from_this()));
        }
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) return fail(ec, "write");

        // 只读取响应头，不缓冲body
        lowest_layer().expires_after(transport_.io_timeout_);
        if (transport_.secure_) {
            http::async_read_header(*transport_.ssl_stream_, buffer_, parser_,
                beast::bind_front_handler(&Operation::on_read_header, shared_from_this()));
        } else {
            http::async_read_header(*transport_.plain_stream_, buffer_, parser_,
                beast::bind_front_handler(&Operation::on_read_header, shared_from_this()));
        }
    }

    void on_read_header(beast::error_code ec, std::size_t) {
        if (ec) return fail(ec, "read_header");

        lowest_layer().expires_never();
        status_ = parser_.get().result_int();
        if (transport_.debug_) {
            std::cout << "[Transport] " << request_.message.method_string() << " " << request_.url
                      << " -> " << status_ << std::endl;
        }
    }

    void fail(beast::error_code ec, char const* what) {
        if (transport_.debug_) {
            std::cerr << "[Transport] Error in " << what << ": " << ec.message() << std::endl;
        }
        ec_ = ec;
    }

    BeastHttpTransport& transport_;
    const HubRequest& request_;
    tcp::resolver resolver_;
    beast::flat_buffer buffer_;
    http::response_parser<http::empty_body> parser_;
    beast::error_code& ec_;
    unsigned& status_;
};

BeastHttpTransport::BeastHttpTransport(ssl::context& ctx, bool debug, std::chrono::seconds io_timeout)
    : ctx_(ctx), debug_(debug), io_timeout_(io_timeout) {}

BeastHttpTransport::~BeastHttpTransport() {
    close();
}

bool BeastHttpTransport::connected() const {
    if (secure_) return ssl_stream_ && beast::get_lowest_layer(*ssl_stream_).socket().is_open();
    return plain_stream_ && plain_stream_->socket().is_open();
}

unsigned BeastHttpTransport::send(const HubRequest& request, beast::error_code& ec) {
    ec = {};
    unsigned status = 0;

    auto const& target = request.target;
    if (connected() && (target.host != host_ || target.port != port_ || target.secure != secure_)) {
        close();
    }

    ioc_.restart();
    auto op = std::make_shared<Operation>(*this, request, ec, status);
    op->run();
    ioc_.run();

    // 出错、服务端不保持连接、或响应还带有未读取的body时，释放连接
    if (ec || !op->parser().keep_alive() || !op->parser().is_done()) {
        close();
    }
    return status;
}

bool BeastHttpTransport::peer_alive() {
    auto& socket = secure_ ? beast::get_lowest_layer(*ssl_stream_).socket() : plain_stream_->socket();

    beast::error_code ec;
    bool const was_non_blocking = socket.non_blocking();
    socket.non_blocking(true, ec);
    if (ec) return false;

    char byte;
    socket.receive(net::buffer(&byte, 1), tcp::socket::message_peek, ec);

    beast::error_code restore_ec;
    socket.non_blocking(was_non_blocking, restore_ec);

    // 没有请求在途时，只有 would_block 表示连接仍然正常；
    // eof、错误或已到达的数据（如TLS close_notify）都说明对端已结束该连接
    return ec == net::error::would_block;
}

void BeastHttpTransport::close() {
    beast::error_code ec;
    if (ssl_stream_) {
        auto& socket = beast::get_lowest_layer(*ssl_stream_).socket();
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
        ssl_stream_.reset();
    }
    if (plain_stream_) {
        plain_stream_->socket().shutdown(tcp::socket::shutdown_both, ec);
        plain_stream_->socket().close(ec);
        plain_stream_.reset();
    }
    if (debug_ && ec && ec != beast::errc::not_connected) {
        std::cerr << "[Transport] Close error: " << ec.message() << std::endl;
    }
}

} // namespace hub_client
