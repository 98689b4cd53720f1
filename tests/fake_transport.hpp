#ifndef HUB_CLIENT_TESTS_FAKE_TRANSPORT_HPP
#define HUB_CLIENT_TESTS_FAKE_TRANSPORT_HPP

#include "hub_client/http_transport.hpp"

#include <deque>
#include <string>
#include <vector>

namespace hub_client::tests {

inline std::string to_string(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

struct RecordedRequest {
    http::verb method;
    std::string url;
    std::string target;
    std::string authorization;
    std::string accept;
    std::string content_type;
    std::string body;
};

/**
 * 记录每个请求并按脚本返回状态码；脚本为空时返回 202。
 */
class FakeTransport : public HttpTransport {
public:
    unsigned send(const HubRequest& request, beast::error_code& ec) override {
        auto const& msg = request.message;
        sent.push_back(RecordedRequest{
            msg.method(),
            request.url,
            to_string(msg.target()),
            to_string(msg[http::field::authorization]),
            to_string(msg[http::field::accept]),
            to_string(msg[http::field::content_type]),
            msg.body(),
        });

        if (!errors.empty()) {
            ec = errors.front();
            errors.pop_front();
            return 0;
        }
        if (statuses.empty()) return 202;
        auto status = statuses.front();
        statuses.pop_front();
        return status;
    }

    std::vector<RecordedRequest> sent;
    std::deque<unsigned> statuses;
    std::deque<beast::error_code> errors;
};

inline std::string fake_token(const std::string& url, const std::string& sender) {
    return "token(" + url + "|" + sender + ")";
}

} // namespace hub_client::tests

#endif // HUB_CLIENT_TESTS_FAKE_TRANSPORT_HPP
