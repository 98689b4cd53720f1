#include "hub_client/url.hpp"
#include <stdexcept>

namespace hub_client {

Url parse_url(std::string_view url) {
    Url out;
    std::string_view url_sv(url);

    // 1. 确定协议并设置默认端口
    if (url_sv.rfind("https://", 0) == 0) {
        out.secure = true;
        out.port = "443";
        url_sv.remove_prefix(8);
    } else if (url_sv.rfind("http://", 0) == 0) {
        out.port = "80";
        url_sv.remove_prefix(7);
    } else {
        throw std::invalid_argument("Invalid URL scheme, expected http:// or https:// in: " + std::string(url));
    }

    auto path_pos = url_sv.find('/');
    std::string_view authority;
    if (path_pos == std::string_view::npos) {
        authority = url_sv;
        out.target = "/";
    } else {
        authority = url_sv.substr(0, path_pos);
        out.target = std::string(url_sv.substr(path_pos));
    }

    auto port_pos = authority.find(':');
    if (port_pos != std::string_view::npos) {
        out.host = std::string(authority.substr(0, port_pos));
        out.port = std::string(authority.substr(port_pos + 1));
    } else {
        out.host = std::string(authority);
    }

    if (out.host.empty()) {
        throw std::invalid_argument("Could not extract host from URL: " + std::string(url));
    }
    if (out.port.empty()) {
        throw std::invalid_argument("Empty port in URL: " + std::string(url));
    }
    return out;
}

} // namespace hub_client
