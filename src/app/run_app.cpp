/**
 * @file run_app.cpp
 * @brief system_dnsコマンドの本体
 * @author sawada
 * @date 2026-10-19
 */

#include <cstdlib>
#include <exception>

#include "app/run_app.hpp"
#include "json/json_codec.hpp"
#include "logger/logger.hpp"
#include "read_config/read_config.hpp"
#include "system_dns/system_dns.hpp"

namespace {
    bool read_config(const std::string& config_file, app_config_data_t& config)
    {
        ReadConfig read_config;

        bool ret = false;

        try {
            ret = read_config.load_config(config_file);
        }
        catch (const std::exception& e) {
            get_logger()->critical("Exception during config loading: {}", e.what());

            return false;
        }

        if (!ret) {
            get_logger()->error("Failed to load {}", config_file);

            return false;
        }

        config = read_config.get_config_data();

        return true;
    }
}

int run_app(const std::string& config_file, std::ostream& out)
{
    app_config_data_t config;

    if (!read_config(config_file, config)) {
        return EXIT_FAILURE;
    }

    try {
        init_logger(config.logger.log_file, config.logger.level);
    }
    catch (const spdlog::spdlog_ex& e) {
        get_logger()->critical("Failed to init logger: {}", e.what());

        return EXIT_FAILURE;
    }

    SystemDns system_dns(config.resolver);

    SystemDns::query_result result = system_dns.query();

    if (result.state == SystemDns::query_state::CONFIG_UNAVAILABLE) {
        get_logger()->warn("No resolver configuration available ({})", result.source);
    }

    if (config.output.fmt == app_config_data_t::output::format::JSON) {
        out << JsonCodec::serialize_snapshot(JsonCodec::make_snapshot(result)) << "\n";
    }
    else {
        for (const auto& server : result.servers) {
            out << server << "\n";
        }
    }

    out.flush();

    return EXIT_SUCCESS;
}
