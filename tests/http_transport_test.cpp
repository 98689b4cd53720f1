#include "hub_client/dispatcher.hpp"
#include "hub_client/http_transport.hpp"
#include "fake_transport.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace hub_client;

namespace {

struct ServedRequest {
    int connection;
    http::verb method;
    std::string target;
    std::string authorization;
    std::string body;
};

/**
 * 回环HTTP服务器：按顺序返回脚本中的 (状态码, body)，记录收到的请求和所在的连接序号。
 */
class LoopbackServer {
public:
    LoopbackServer(std::deque<std::pair<unsigned, std::string>> script, int connections,
                   bool close_after_response = false)
        : acceptor_(ioc_, tcp::endpoint{net::ip::make_address("127.0.0.1"), 0}),
          script_(std::move(script)),
          close_after_response_(close_after_response) {
        thread_ = std::thread([this, connections] { serve(connections); });
    }

    ~LoopbackServer() {
        if (thread_.joinable()) thread_.join();
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

    void join() { thread_.join(); }

    std::vector<ServedRequest> requests;
    std::atomic<int> closed_connections{0};

private:
    void serve(int connections) {
        for (int conn = 0; conn < connections; ++conn) {
            tcp::socket socket(ioc_);
            beast::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec) return;

            beast::flat_buffer buffer;
            for (;;) {
                http::request<http::string_body> req;
                http::read(socket, buffer, req, ec);
                if (ec) break;

                requests.push_back(ServedRequest{
                    conn,
                    req.method(),
                    tests::to_string(req.target()),
                    tests::to_string(req[http::field::authorization]),
                    req.body(),
                });

                auto [status, body] = script_.empty() ? std::make_pair(202u, std::string{}) : script_.front();
                if (!script_.empty()) script_.pop_front();

                http::response<http::string_body> res{http::int_to_status(status), req.version()};
                res.keep_alive(req.keep_alive());
                res.body() = body;
                res.prepare_payload();
                http::write(socket, res, ec);
                if (ec || close_after_response_) break;
            }
            // 响应里仍声明 keep-alive，但服务端直接关闭连接
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
            ++closed_connections;
        }
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::deque<std::pair<unsigned, std::string>> script_;
    bool close_after_response_;
    std::thread thread_;
};

HubRequest loopback_request(unsigned short port, const OperationKind& kind) {
    auto hub_path = "http://127.0.0.1:" + std::to_string(port) + "/api/v1/hubs/chat";
    return build_request(kind, hub_path, SenderIdentity("host_abc"), tests::fake_token);
}

} // namespace

TEST_CASE("Beast transport reuses the connection and drops it after an unread body", "[transport]") {
    LoopbackServer server({{202, ""}, {202, ""}, {401, "unauthorized"}, {202, ""}}, 2);
    ssl::context ctx{ssl::context::tlsv12_client};

    std::vector<unsigned> statuses;
    {
        BeastHttpTransport transport(ctx, false);
        Dispatcher dispatcher(transport, false);

        auto first = dispatcher.dispatch(loopback_request(server.port(), Broadcast{}));
        REQUIRE(transport.connected());
        auto second = dispatcher.dispatch(loopback_request(server.port(), AddToGroup{"g", "u"}));
        auto third = dispatcher.dispatch(loopback_request(server.port(), SendToUser{"bob"}));
        REQUIRE_FALSE(transport.connected());
        auto fourth = dispatcher.dispatch(loopback_request(server.port(), RemoveFromGroup{"g", "u"}));

        REQUIRE(first.ok());
        REQUIRE(second.ok());
        REQUIRE(third.kind == Outcome::Kind::Rejected);
        REQUIRE(third.status == 401);
        REQUIRE(fourth.ok());
    }
    server.join();

    REQUIRE(server.requests.size() == 4);
    REQUIRE(server.requests[0].connection == 0);
    REQUIRE(server.requests[1].connection == 0);
    REQUIRE(server.requests[2].connection == 0);
    REQUIRE(server.requests[3].connection == 1);

    REQUIRE(server.requests[0].method == http::verb::post);
    REQUIRE(server.requests[0].target == "/api/v1/hubs/chat");
    REQUIRE_FALSE(server.requests[0].body.empty());

    REQUIRE(server.requests[1].method == http::verb::put);
    REQUIRE(server.requests[1].target == "/api/v1/hubs/chat/groups/g/users/u");
    REQUIRE(server.requests[1].body.empty());
    REQUIRE(server.requests[1].authorization.rfind("Bearer token(http://127.0.0.1:", 0) == 0);

    REQUIRE(server.requests[3].method == http::verb::delete_);
}

TEST_CASE("Connection failure is reported as a transport error", "[transport]") {
    unsigned short closed_port = 0;
    {
        net::io_context ioc;
        tcp::acceptor probe(ioc, tcp::endpoint{net::ip::make_address("127.0.0.1"), 0});
        closed_port = probe.local_endpoint().port();
    }

    ssl::context ctx{ssl::context::tlsv12_client};
    BeastHttpTransport transport(ctx, false, std::chrono::seconds(5));
    Dispatcher dispatcher(transport, false);

    auto outcome = dispatcher.dispatch(loopback_request(closed_port, Broadcast{}));
    REQUIRE(outcome.kind == Outcome::Kind::TransportFailed);
    REQUIRE_FALSE(outcome.error.empty());
    REQUIRE_FALSE(transport.connected());
}

TEST_CASE("Idle connection closed by the server is replaced before the next request", "[transport]") {
    LoopbackServer server({{202, ""}, {202, ""}}, 2, true);
    ssl::context ctx{ssl::context::tlsv12_client};

    {
        BeastHttpTransport transport(ctx, false);
        Dispatcher dispatcher(transport, false);

        auto first = dispatcher.dispatch(loopback_request(server.port(), Broadcast{}));
        REQUIRE(first.ok());
        REQUIRE(transport.connected());

        auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (server.closed_connections.load() < 1 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        REQUIRE(server.closed_connections.load() == 1);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        auto second = dispatcher.dispatch(loopback_request(server.port(), SendToUser{"bob"}));
        REQUIRE(second.ok());
    }
    server.join();

    REQUIRE(server.requests.size() == 2);
    REQUIRE(server.requests[0].connection == 0);
    REQUIRE(server.requests[1].connection == 1);
    REQUIRE(server.requests[1].target == "/api/v1/hubs/chat/users/bob");
}
