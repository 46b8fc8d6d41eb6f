#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <cxxopts.hpp>
#include <mw/error.hpp>
#include <mw/http_server.hpp>
#include <spdlog/spdlog.h>

#include "app.hpp"
#include "config.hpp"
#include "message_store.hpp"

int main(int argc, char** argv)
{
    cxxopts::Options cmd_options("hookbox", "Signed webhook message inbox");
    cmd_options.add_options()
        ("c,config", "Config file",
         cxxopts::value<std::string>())
        ("h,help", "Print this message.");
    auto opts = cmd_options.parse(argc, argv);

    if(opts.count("help"))
    {
        std::cout << cmd_options.help() << std::endl;
        return 0;
    }

    Config config;
    if(opts.count("config"))
    {
        const std::string config_file = opts["config"].as<std::string>();
        try
        {
            config.load(config_file);
        }
        catch(const std::exception& e)
        {
            std::cerr << "Failed to load config from " << config_file << ": "
                      << e.what() << std::endl;
            return 1;
        }
    }
    if(auto res = config.loadEnv(); !res)
    {
        std::cerr << mw::errorMsg(res.error()) << std::endl;
        return 1;
    }
    if(auto res = config.validate(); !res)
    {
        std::cerr << mw::errorMsg(res.error()) << std::endl;
        return 1;
    }

    spdlog::set_pattern("%Y-%m-%dT%H:%M:%S.%fZ [%^%l%$] %v",
                        spdlog::pattern_time_type::utc);
    spdlog::level::level_enum level = spdlog::level::from_str(config.log_level);
    if(level == spdlog::level::off && config.log_level != "off")
    {
        spdlog::warn("Unknown log level {}, using info.", config.log_level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);

    auto store = std::make_unique<MessageStore>(config.db_path);
    if(auto res = store->init(); !res)
    {
        spdlog::error("Failed to initialize database at {}: {}", config.db_path,
                      mw::errorMsg(res.error()));
        return 1;
    }
    spdlog::info("Database ready at {}.", config.db_path);

    mw::HTTPServer::ListenAddress listen =
        mw::IPSocketInfo{config.listen_address,
                         static_cast<uint16_t>(config.port)};
    App app(config, std::move(store), listen);
    spdlog::info("Listening at http://{}:{}/...", config.listen_address,
                 config.port);
    if(auto res = app.start(); !res)
    {
        spdlog::error("Failed to start server: {}", mw::errorMsg(res.error()));
        return 1;
    }
    app.wait();
    return 0;
}
