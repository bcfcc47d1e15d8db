/**
 * @file read_config.hpp
 * @brief 設定ファイルの読み込みクラス
 * @author sawada
 * @date 2026-10-19
 */

#ifndef READ_CONFIG_HPP_
#define READ_CONFIG_HPP_

#include <string>
#include <cstdint>

#include "system_dns/system_dns.hpp"

struct app_config_data_t {
    resolver_config_t resolver;

    struct output {
        enum class format : std::uint8_t {
            TEXT,
            JSON
        };

        format fmt;
    } output;

    struct logger {
        std::string log_file;
        std::string level;
    } logger;
};

/**
 * @class ReadConfig
 * @brief YAML設定ファイル読み込みクラス
 */
class ReadConfig {
    public:
        ReadConfig();
        ~ReadConfig() = default;

        bool load_config(const std::string& config_file_path);

        const app_config_data_t& get_config_data() const;
    private:
        static app_config_data_t::output::format parse_output_format(const std::string& fmt);

        app_config_data_t config_data_;
};

#endif
