#include "ligaproxy/env.hpp"
#include <cstdlib>
#include <fstream>
#include <string_view>

namespace ligaproxy {

namespace {

std::string_view trim(std::string_view sv) {
    auto start = sv.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};
    auto end = sv.find_last_not_of(" \t\r\n");
    return sv.substr(start, end - start + 1);
}

// Quoted values keep everything between the quotes; unquoted values drop
// a trailing " # comment".
std::string parse_value(std::string_view raw) {
    if (raw.size() >= 2 && (raw.front() == '"' || raw.front() == '\'')) {
        auto close = raw.find(raw.front(), 1);
        if (close != std::string_view::npos) return std::string(raw.substr(1, close - 1));
    }
    auto comment = raw.find(" #");
    if (comment != std::string_view::npos) raw = trim(raw.substr(0, comment));
    return std::string(raw);
}

} // namespace

std::unordered_map<std::string, std::string> load_env(const std::filesystem::path& path) {
    std::unordered_map<std::string, std::string> vars;
    std::ifstream file(path);
    if (!file.is_open()) return vars;

    std::string line;
    while (std::getline(file, line)) {
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed.front() == '#') continue;

        if (trimmed.starts_with("export ")) trimmed = trim(trimmed.substr(7));

        auto eq = trimmed.find('=');
        if (eq == std::string_view::npos) continue;

        auto key = std::string(trim(trimmed.substr(0, eq)));
        if (key.empty()) continue;

        auto val = parse_value(trim(trimmed.substr(eq + 1)));
        vars[key] = val;
        ::setenv(key.c_str(), val.c_str(), 0);
    }

    return vars;
}

std::optional<std::string> get_env(const std::string& key) {
    if (auto* val = std::getenv(key.c_str())) {
        return std::string(val);
    }
    return std::nullopt;
}

} // namespace ligaproxy
