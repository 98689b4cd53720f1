#include "hub_client/hub_endpoint.hpp"
#include "hub_client/string_utils.hpp"

namespace hub_client {

HubEndpoint::HubEndpoint(std::string base_uri, std::string hub_name)
    : base_uri_(std::move(base_uri)), hub_name_(to_lower(hub_name)) {}

std::string HubEndpoint::base_hub_path() const {
    return base_uri_ + "/api/v1/hubs/" + hub_name_;
}

std::string base_hub_path(const std::string& endpoint, const std::string& hub_name) {
    return HubEndpoint(endpoint, hub_name).base_hub_path();
}

} // namespace hub_client
