#include "ligaproxy/audit.hpp"
#include <iomanip>
#include <sstream>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ligaproxy::audit {

namespace {

std::string serialize(const RequestContext& ctx, std::initializer_list<LogField> fields) {
    std::ostringstream out;
    out << "requestId=" << (ctx.request_id.empty() ? "N/A" : ctx.request_id);
    for (const auto& field : fields) {
        out << ' ' << field.key << '=' << field.value;
    }
    return out.str();
}

} // namespace

LogField string_field(std::string_view key, std::string_view value) {
    return {std::string(key), std::string(value)};
}

LogField int_field(std::string_view key, std::int64_t value) {
    return {std::string(key), std::to_string(value)};
}

LogField double_field(std::string_view key, double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return {std::string(key), oss.str()};
}

LogField bool_field(std::string_view key, bool value) {
    return {std::string(key), value ? "true" : "false"};
}

void init_logging(const std::string& level, const std::string& pattern) {
    auto logger = spdlog::stdout_color_mt("ligaproxy");
    logger->set_pattern(pattern.empty() ? std::string(default_pattern) : pattern);
    logger->set_level(spdlog::level::from_str(level));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
    spdlog::shutdown();
}

void log(spdlog::level::level_enum level, const RequestContext& ctx,
         std::string_view stage, std::initializer_list<LogField> fields) {
    spdlog::log(level, "{} {}", stage, serialize(ctx, fields));
}

} // namespace ligaproxy::audit
