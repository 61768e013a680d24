#pragma once

#include "ligaproxy/types.hpp"
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <spdlog/common.h>

namespace ligaproxy::audit {

struct LogField {
    std::string key;
    std::string value;
};

LogField string_field(std::string_view key, std::string_view value);
LogField int_field(std::string_view key, std::int64_t value);
LogField double_field(std::string_view key, double value);
LogField bool_field(std::string_view key, bool value);

inline constexpr std::string_view default_pattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

void init_logging(const std::string& level, const std::string& pattern);
void shutdown_logging();

// Emits "<stage> requestId=<id> key=value ..." at the given level.
void log(spdlog::level::level_enum level, const RequestContext& ctx,
         std::string_view stage, std::initializer_list<LogField> fields = {});

inline void info(const RequestContext& ctx, std::string_view stage,
                 std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::info, ctx, stage, fields);
}

inline void warn(const RequestContext& ctx, std::string_view stage,
                 std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::warn, ctx, stage, fields);
}

inline void error(const RequestContext& ctx, std::string_view stage,
                  std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::err, ctx, stage, fields);
}

} // namespace ligaproxy::audit
