#include "hub_client/connection_string.hpp"
#include "hub_client/string_utils.hpp"
#include "hub_client/url.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace hub_client {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

} // namespace

ConnectionString parse_connection_string(std::string_view text) {
    ConnectionString cs;
    std::string port;

    while (!text.empty()) {
        auto sep = text.find(';');
        auto entry = trim(text.substr(0, sep));
        text = sep == std::string_view::npos ? std::string_view{} : text.substr(sep + 1);
        if (entry.empty()) continue;

        // 值本身可能含有 '='（例如 base64 编码的 AccessKey），只按第一个 '=' 切分
        auto eq = entry.find('=');
        if (eq == std::string_view::npos) {
            throw std::invalid_argument("Malformed connection string entry: " + std::string(entry));
        }
        auto key = to_lower(trim(entry.substr(0, eq)));
        auto value = std::string(trim(entry.substr(eq + 1)));

        if (key == "endpoint") {
            cs.endpoint = std::move(value);
        } else if (key == "accesskey") {
            cs.access_key = std::move(value);
        } else if (key == "version") {
            cs.version = std::move(value);
        } else if (key == "port") {
            port = std::move(value);
        }
    }

    if (cs.endpoint.empty()) {
        throw std::invalid_argument("Connection string is missing Endpoint");
    }
    if (cs.access_key.empty()) {
        throw std::invalid_argument("Connection string is missing AccessKey");
    }

    while (!cs.endpoint.empty() && cs.endpoint.back() == '/') {
        cs.endpoint.pop_back();
    }

    // 校验 Endpoint 是合法的 http(s) URL
    auto url = parse_url(cs.endpoint);

    if (!port.empty()) {
        if (!std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw std::invalid_argument("Invalid Port in connection string: " + port);
        }
        auto scheme_end = cs.endpoint.find("://") + 3;
        cs.endpoint = cs.endpoint.substr(0, scheme_end) + url.host + ":" + port + (url.target == "/" ? "" : url.target);
    }

    return cs;
}

} // namespace hub_client
