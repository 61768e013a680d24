#include "ligaproxy/config.hpp"
#include "ligaproxy/env.hpp"
#include "ligaproxy/http_transport.hpp"
#include "ligaproxy/openliga_provider.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <spdlog/common.h>

namespace ligaproxy {

namespace {

std::expected<int, std::string> env_int(const std::string& key, int fallback, int min, int max) {
    auto raw = get_env(key);
    if (!raw) return fallback;

    int value = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
    if (ec != std::errc{} || ptr != raw->data() + raw->size()) {
        return std::unexpected(key + " must be an integer, got '" + *raw + "'");
    }
    if (value < min || value > max) {
        return std::unexpected(key + " must be between " + std::to_string(min) + " and " +
                               std::to_string(max));
    }
    return value;
}

std::expected<double, std::string> env_double(const std::string& key, double fallback,
                                              double min, double max) {
    auto raw = get_env(key);
    if (!raw) return fallback;

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
    if (ec != std::errc{} || ptr != raw->data() + raw->size()) {
        return std::unexpected(key + " must be a number, got '" + *raw + "'");
    }
    if (value < min || value > max) {
        return std::unexpected(key + " is out of range");
    }
    return value;
}

// Case-insensitive spdlog level name, returned lower-cased.
std::expected<std::string, std::string> env_log_level(const std::string& fallback) {
    auto level = get_env("LOG_LEVEL").value_or(fallback);
    std::ranges::transform(level, level.begin(), [](unsigned char c) { return std::tolower(c); });

    // from_str maps every unknown name to off.
    if (spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
        return std::unexpected("LOG_LEVEL must be one of trace, debug, info, warn, error, "
                               "critical, off; got '" + level + "'");
    }
    return level;
}

} // namespace

ProviderSettings ProxyConfig::provider_settings() const {
    return {
        .rate_limit_requests = rate_limit_requests,
        .rate_limit_window = std::chrono::seconds(rate_limit_window),
        .retry = retry,
    };
}

std::expected<ProxyConfig, std::string> load_config() {
    ProxyConfig config;
    config.provider_name = get_env("PROVIDER_NAME").value_or(config.provider_name);
    config.upstream_host = get_env("UPSTREAM_HOST").value_or(config.upstream_host);
    config.log_pattern = get_env("LOG_PATTERN").value_or(config.log_pattern);
    config.host = get_env("HOST").value_or(config.host);

    auto requests = env_int("RATE_LIMIT_REQUESTS", config.rate_limit_requests, 1, 1'000'000);
    if (!requests) return std::unexpected(requests.error());
    config.rate_limit_requests = *requests;

    auto window = env_int("RATE_LIMIT_WINDOW", config.rate_limit_window, 1, 86'400);
    if (!window) return std::unexpected(window.error());
    config.rate_limit_window = *window;

    auto retries = env_int("MAX_RETRIES", config.retry.max_retries, 0, 100);
    if (!retries) return std::unexpected(retries.error());
    config.retry.max_retries = *retries;

    auto base = env_double("BASE_DELAY", config.retry.base_delay.count(), 0.0, 3600.0);
    if (!base) return std::unexpected(base.error());
    config.retry.base_delay = Seconds(*base);

    auto max = env_double("MAX_DELAY", config.retry.max_delay.count(), 0.0, 3600.0);
    if (!max) return std::unexpected(max.error());
    config.retry.max_delay = Seconds(*max);

    auto multiplier = env_double("BACKOFF_MULTIPLIER", config.retry.backoff_multiplier, 1.0, 100.0);
    if (!multiplier) return std::unexpected(multiplier.error());
    config.retry.backoff_multiplier = *multiplier;

    auto jitter = env_double("JITTER_RANGE", config.retry.jitter_range, 0.0, 1.0);
    if (!jitter) return std::unexpected(jitter.error());
    config.retry.jitter_range = *jitter;

    auto level = env_log_level(config.log_level);
    if (!level) return std::unexpected(level.error());
    config.log_level = *level;

    auto port = env_int("PORT", config.port, 1, 65535);
    if (!port) return std::unexpected(port.error());
    config.port = *port;

    return config;
}

std::expected<std::unique_ptr<Provider>, std::string> create_provider(const ProxyConfig& config) {
    if (config.provider_name == "openliga") {
        return std::make_unique<OpenLigaProvider>(
            config.provider_settings(),
            std::make_unique<HttplibTransport>(config.upstream_host));
    }
    return std::unexpected("Unknown provider: " + config.provider_name);
}

} // namespace ligaproxy
