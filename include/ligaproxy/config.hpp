#pragma once

#include "ligaproxy/provider.hpp"
#include "ligaproxy/types.hpp"
#include <expected>
#include <memory>
#include <string>

namespace ligaproxy {

struct ProxyConfig {
    std::string provider_name = "openliga";
    std::string upstream_host = "api.openligadb.de";

    int rate_limit_requests = 10;
    int rate_limit_window = 60; // seconds
    RetryPolicy retry;

    std::string log_level = "info";
    std::string log_pattern;

    std::string host = "0.0.0.0";
    int port = 8000;

    ProviderSettings provider_settings() const;
};

// Builds the config from environment variables (RATE_LIMIT_REQUESTS,
// MAX_RETRIES, ...). Unset variables keep their defaults; malformed or
// out-of-range values are an error.
std::expected<ProxyConfig, std::string> load_config();

// Only "openliga" is known.
std::expected<std::unique_ptr<Provider>, std::string> create_provider(const ProxyConfig& config);

} // namespace ligaproxy
