#pragma once
#include <chrono>
#include <string>

#include <mw/error.hpp>

// Built once at startup and handed out by reference.
struct Config
{
    std::string listen_address = "0.0.0.0";
    int port = 8000;
    std::string db_path = "./hookbox.db";
    std::string webhook_secret;
    std::string log_level = "info";
    int query_timeout_ms = 5000;

    // Throws std::runtime_error if the file cannot be read.
    void load(const std::string& path);
    // Apply LISTEN_ADDRESS, PORT, DATABASE_URL, WEBHOOK_SECRET and
    // LOG_LEVEL from the environment, where set.
    mw::E<void> loadEnv();
    mw::E<void> validate() const;

    std::chrono::milliseconds queryTimeout() const
    {
        return std::chrono::milliseconds(query_timeout_ms);
    }
};
