/**
 * @file logger.hpp
 * @brief logger
 * @author sawada souta
 * @date 2026-10-19
 */

#ifndef LOGGER_HPP_
#define LOGGER_HPP_

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

constexpr const char* LOGGER_NAME = "system_dns";

inline std::mutex& logger_mutex()
{
    static std::mutex mtx;

    return mtx;
}

/**
 * @brief ライブラリとCLIが使うロガーの取得
 * @details 標準出力は結果の出力に使うので, init_logger()前でもstderrに出す
 */
inline std::shared_ptr<spdlog::logger> get_logger()
{
    std::lock_guard<std::mutex> lock(logger_mutex());

    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
    }

    return logger;
}

/**
 * @brief ロガーの初期化
 * @details 同名のロガーを置き換えてデフォルトロガーにもする
 * @param[in] log_file ログファイルのパス 空ならファイル出力なし
 * @param[in] level spdlogのレベル名
 */
inline void init_logger(const std::string& log_file, const std::string& level)
{
    std::vector<spdlog::sink_ptr> sinks;

    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, 10 * 1024 * 1024, 5
        ));
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(level));

    std::lock_guard<std::mutex> lock(logger_mutex());

    spdlog::drop(LOGGER_NAME);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

#endif
