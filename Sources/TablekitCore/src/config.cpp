#include "tablekit/config.hpp"
#include "tablekit/errors.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tablekit {

using json = nlohmann::json;

std::optional<log_level> log_level_from_string(const std::string& name) {
    std::string lower;
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "off" || lower == "none") return log_level::off;
    if (lower == "error") return log_level::error;
    if (lower == "warn" || lower == "warning") return log_level::warn;
    if (lower == "info") return log_level::info;
    if (lower == "debug") return log_level::debug;
    return std::nullopt;
}

const char* to_string(log_level level) {
    switch (level) {
        case log_level::off: return "off";
        case log_level::error: return "error";
        case log_level::warn: return "warn";
        case log_level::info: return "info";
        case log_level::debug: return "debug";
    }
    return "warn";
}

static std::chrono::milliseconds millis_field(const json& j, const char* key, std::chrono::milliseconds fallback) {
    if (j.contains(key) && j[key].is_number_integer()) {
        auto ms = j[key].get<int64_t>();
        if (ms < 0) {
            throw validation_error(std::string("Configuration value must not be negative: ") + key, key);
        }
        return std::chrono::milliseconds(ms);
    }
    return fallback;
}

configuration configuration::from_json_file(const std::string& file) {
    std::ifstream in(file);
    if (!in) {
        throw validation_error("Cannot read configuration file " + file);
    }

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw validation_error("Malformed configuration file " + file + ": " + e.what());
    }
    if (!j.is_object()) {
        throw validation_error("Configuration file " + file + " must contain a JSON object");
    }

    configuration config;
    if (j.contains("dialect") && j["dialect"].is_string()) {
        auto d = j["dialect"].get<std::string>();
        if (d == "sqlite") {
            config.dialect = dialect_kind::sqlite;
        } else if (d == "mysql") {
            config.dialect = dialect_kind::mysql;
        } else {
            throw validation_error("Unknown dialect: " + d, "dialect");
        }
    }
    if (j.contains("path") && j["path"].is_string()) {
        config.path = j["path"].get<std::string>();
    }
    if (j.contains("host") && j["host"].is_string()) {
        config.host = j["host"].get<std::string>();
    }
    if (j.contains("port") && j["port"].is_number_unsigned()) {
        config.port = j["port"].get<unsigned int>();
    }
    if (j.contains("user") && j["user"].is_string()) {
        config.user = j["user"].get<std::string>();
    }
    if (j.contains("password") && j["password"].is_string()) {
        config.password = j["password"].get<std::string>();
    }
    if (j.contains("database") && j["database"].is_string()) {
        config.database = j["database"].get<std::string>();
    }
    if (j.contains("pool_size") && j["pool_size"].is_number_unsigned()) {
        config.pool_size = j["pool_size"].get<size_t>();
    }
    config.acquire_timeout = millis_field(j, "acquire_timeout_ms", config.acquire_timeout);
    config.lock_timeout = millis_field(j, "lock_timeout_ms", config.lock_timeout);
    config.mutation_lock_timeout = millis_field(j, "mutation_lock_timeout_ms", config.mutation_lock_timeout);
    if (j.contains("max_page_size") && j["max_page_size"].is_number_integer()) {
        config.max_page_size = j["max_page_size"].get<int64_t>();
        if (config.max_page_size <= 0) {
            throw validation_error("max_page_size must be positive", "max_page_size");
        }
    }
    if (j.contains("on_delete_table") && j["on_delete_table"].is_string()) {
        auto policy = j["on_delete_table"].get<std::string>();
        if (policy == "retain") {
            config.on_delete_table = delete_table_policy::retain;
        } else if (policy == "drop") {
            config.on_delete_table = delete_table_policy::drop;
        } else {
            throw validation_error("Unknown on_delete_table policy: " + policy, "on_delete_table");
        }
    }
    if (j.contains("log_level") && j["log_level"].is_string()) {
        auto level = log_level_from_string(j["log_level"].get<std::string>());
        if (!level) {
            throw validation_error("Unknown log level: " + j["log_level"].get<std::string>(), "log_level");
        }
        config.level = *level;
    }
    return config;
}

void configuration::apply_environment() {
    auto env = [](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (!value || !*value) return std::nullopt;
        return std::string(value);
    };

    if (auto v = env("DB_HOST")) {
        host = *v;
        dialect = dialect_kind::mysql;
    }
    if (auto v = env("DB_PORT")) {
        unsigned int parsed = 0;
        auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), parsed);
        if (ec != std::errc() || ptr != v->data() + v->size() || parsed == 0 || parsed > 65535) {
            LOG_WARN("config", "Invalid DB_PORT %s, keeping %u", v->c_str(), port);
        } else {
            port = parsed;
        }
    }
    if (auto v = env("DB_USER")) user = *v;
    if (auto v = env("DB_PASS")) password = *v;
    if (auto v = env("DB_NAME")) database = *v;
    if (auto v = env("LOG_LEVEL")) {
        if (auto parsed = log_level_from_string(*v)) {
            level = *parsed;
        } else {
            LOG_WARN("config", "Unknown LOG_LEVEL %s, keeping %s", v->c_str(), to_string(level));
        }
    }
}

std::string configuration::describe() const {
    std::ostringstream out;
    out << "dialect=" << to_string(dialect);
    if (dialect == dialect_kind::sqlite) {
        out << " path=" << path;
    } else {
        out << " host=" << host << " port=" << port << " user=" << user
            << " password=" << (password.empty() ? "" : "***") << " database=" << database;
    }
    out << " pool_size=" << effective_pool_size()
        << " on_delete_table=" << to_string(on_delete_table)
        << " log_level=" << to_string(level);
    return out.str();
}

} // namespace tablekit
