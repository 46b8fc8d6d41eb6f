#include "config.hpp"
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <ryml.hpp>
#include <ryml_std.hpp> // For std::string support

namespace {

constexpr std::string_view SQLITE_URL_PREFIX = "sqlite:///";

std::string readFile(const std::string& path) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) throw std::runtime_error("Cannot open config file: " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// Accept both a bare path and a “sqlite:///path” URL.
std::string dbPathFromUrl(std::string_view url) {
    if (url.starts_with(SQLITE_URL_PREFIX)) {
        url.remove_prefix(SQLITE_URL_PREFIX.size());
    }
    return std::string(url);
}

} // namespace

void Config::load(const std::string& path) {
    std::string content = readFile(path);
    // parse_in_arena copies the buffer, so values can be read out after
    // content goes away.
    ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(content));
    ryml::NodeRef root = tree.rootref();

    if (root.has_child("listen_address")) root["listen_address"] >> listen_address;
    if (root.has_child("port")) root["port"] >> port;
    if (root.has_child("db_path")) {
        std::string value;
        root["db_path"] >> value;
        db_path = dbPathFromUrl(value);
    }
    if (root.has_child("webhook_secret")) root["webhook_secret"] >> webhook_secret;
    if (root.has_child("log_level")) root["log_level"] >> log_level;
    if (root.has_child("query_timeout_ms")) root["query_timeout_ms"] >> query_timeout_ms;
}

mw::E<void> Config::loadEnv() {
    if (const char* v = std::getenv("LISTEN_ADDRESS"); v != nullptr) {
        listen_address = v;
    }
    if (const char* v = std::getenv("PORT"); v != nullptr) {
        std::string_view s(v);
        int value = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc() || ptr != s.data() + s.size()) {
            return std::unexpected(mw::runtimeError(
                std::format("Invalid PORT: {}", s)));
        }
        port = value;
    }
    if (const char* v = std::getenv("DATABASE_URL"); v != nullptr) {
        db_path = dbPathFromUrl(v);
    }
    if (const char* v = std::getenv("WEBHOOK_SECRET"); v != nullptr) {
        webhook_secret = v;
    }
    if (const char* v = std::getenv("LOG_LEVEL"); v != nullptr) {
        log_level = v;
    }
    return {};
}

mw::E<void> Config::validate() const {
    if (webhook_secret.empty()) {
        return std::unexpected(mw::runtimeError(
            "WEBHOOK_SECRET environment variable is required"));
    }
    if (port <= 0 || port > 65535) {
        return std::unexpected(mw::runtimeError(
            std::format("Port out of range: {}", port)));
    }
    if (db_path.empty()) {
        return std::unexpected(mw::runtimeError("Database path is empty"));
    }
    if (query_timeout_ms <= 0) {
        return std::unexpected(mw::runtimeError(
            std::format("Invalid query timeout: {}", query_timeout_ms)));
    }
    return {};
}
