#include "hub_client/access_token.hpp"
#include "nlohmann/json.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>
#include <vector>

namespace hub_client {

std::string base64url_encode(std::string_view data) {
    // EVP_EncodeBlock 输出长度为 4*ceil(n/3)，再加结尾的 '\0'
    std::vector<unsigned char> buf(4 * ((data.size() + 2) / 3) + 1);
    int len = EVP_EncodeBlock(buf.data(),
                              reinterpret_cast<const unsigned char*>(data.data()),
                              static_cast<int>(data.size()));
    std::string out(reinterpret_cast<const char*>(buf.data()), static_cast<std::size_t>(len));

    while (!out.empty() && out.back() == '=') out.pop_back();
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

std::string hmac_sha256(std::string_view key, std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (!HMAC(EVP_sha256(),
              key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(),
              digest, &digest_len)) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

AccessTokenGenerator::AccessTokenGenerator(std::string access_key, std::chrono::seconds lifetime)
    : access_key_(std::move(access_key)), lifetime_(lifetime) {
    if (access_key_.empty()) {
        throw std::invalid_argument("Access key must not be empty");
    }
}

std::string AccessTokenGenerator::generate(const std::string& audience, const std::string& sender_id) const {
    return generate(audience, sender_id, std::chrono::system_clock::now());
}

std::string AccessTokenGenerator::generate(const std::string& audience,
                                           const std::string& sender_id,
                                           std::chrono::system_clock::time_point now) const {
    auto const issued = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

    nlohmann::json header = {{"alg", "HS256"}, {"typ", "JWT"}};
    nlohmann::json claims = {
        {"nameid", sender_id},
        {"nbf", issued},
        {"exp", issued + lifetime_.count()},
        {"iat", issued},
        {"aud", audience},
    };

    std::string signing_input = base64url_encode(header.dump()) + "." + base64url_encode(claims.dump());
    return signing_input + "." + base64url_encode(hmac_sha256(access_key_, signing_input));
}

TokenProvider AccessTokenGenerator::as_provider() const {
    return [self = *this](const std::string& audience, const std::string& sender_id) {
        return self.generate(audience, sender_id);
    };
}

} // namespace hub_client
