/**
 * @file read_config.cpp
 * @brief 設定ファイル読み込みクラス実装
 * @author sawada
 * @date 2026-10-19
 * @todo タイポ対策でキーを定数にする
 */

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

#include "read_config/read_config.hpp"

#include "logger/logger.hpp"

namespace {
    constexpr std::size_t MAX_FILE_BYTES_LIMIT = 16 * 1024 * 1024;
}

ReadConfig::ReadConfig()
{
    config_data_.resolver = SystemDns::default_config();

    config_data_.output.fmt = app_config_data_t::output::format::TEXT;

    config_data_.logger.log_file = "";
    config_data_.logger.level = "info";
}

bool ReadConfig::load_config(const std::string& config_file_path)
{
    // 途中で失敗したときに半端な設定が残らないようにする
    app_config_data_t loaded = config_data_;

    try {
        const YAML::Node config = YAML::LoadFile(config_file_path);

        if (!config["resolver"]) {
            throw std::runtime_error("resolver section missing");
        }
        {
            const auto res = config["resolver"];

            if (
                !res["resolv_conf_path"] || !res["follow_stub_resolver"] || !res["stub_upstream_path"] ||
                !res["max_nameservers"] || !res["max_file_bytes"]
            ) {
                throw std::runtime_error("resolver section missing required keys");
            }

            loaded.resolver.resolv_conf_path = res["resolv_conf_path"].as<std::string>();
            loaded.resolver.follow_stub_resolver = res["follow_stub_resolver"].as<bool>();
            loaded.resolver.stub_upstream_path = res["stub_upstream_path"].as<std::string>();

            if (loaded.resolver.resolv_conf_path.empty()) {
                throw std::runtime_error("resolv_conf_path is empty");
            }

            const long long max_nameservers = res["max_nameservers"].as<long long>();

            if (max_nameservers < 0) {
                throw std::runtime_error("max_nameservers out of range(>= 0)");
            }

            loaded.resolver.max_nameservers = static_cast<std::size_t>(max_nameservers);

            const long long max_file_bytes = res["max_file_bytes"].as<long long>();

            if (max_file_bytes < 1 || max_file_bytes > static_cast<long long>(MAX_FILE_BYTES_LIMIT)) {
                throw std::runtime_error("max_file_bytes out of range(1-16777216)");
            }

            loaded.resolver.max_file_bytes = static_cast<std::size_t>(max_file_bytes);
        }

        if (!config["output"]) {
            throw std::runtime_error("output section missing");
        }
        {
            const auto out = config["output"];

            if (!out["format"]) {
                throw std::runtime_error("output section missing required keys");
            }

            loaded.output.fmt = parse_output_format(out["format"].as<std::string>());
        }

        if (!config["logger"]) {
            throw std::runtime_error("logger section missing");
        }
        {
            const auto log = config["logger"];

            if (!log["log_file"] || !log["level"]) {
                throw std::runtime_error("logger section missing required keys");
            }

            loaded.logger.log_file = log["log_file"].as<std::string>();
            loaded.logger.level = log["level"].as<std::string>();

            if (
                spdlog::level::from_str(loaded.logger.level) == spdlog::level::off &&
                loaded.logger.level != "off"
            ) {
                throw std::runtime_error("Invalid log level: " + loaded.logger.level);
            }
        }
    }
    catch (const YAML::BadFile& e) {
        get_logger()->error("Failed to open config file: {}", e.what());

        return false;
    }
    catch (const YAML::Exception& e) {
        get_logger()->error("YAML parse error: {}", e.what());

        return false;
    }
    catch (const std::exception& e) {
        get_logger()->error("Config error: {}", e.what());

        return false;
    }

    config_data_ = loaded;

    return true;
}

const app_config_data_t& ReadConfig::get_config_data() const
{
    return config_data_;
}

app_config_data_t::output::format ReadConfig::parse_output_format(const std::string& fmt)
{
    if (fmt == "text") {
        return app_config_data_t::output::format::TEXT;
    }
    if (fmt == "json") {
        return app_config_data_t::output::format::JSON;
    }

    throw std::runtime_error("Invalid output format: " + fmt + " (expected text or json)");
}
