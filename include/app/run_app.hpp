/**
 * @file run_app.hpp
 * @brief system_dnsコマンドの本体
 * @author sawada
 * @date 2026-10-19
 */

#ifndef RUN_APP_HPP_
#define RUN_APP_HPP_

#include <ostream>
#include <string>

/**
 * @brief 設定を読み込んでDNSサーバの一覧をoutに出力する
 * @details text形式は1行に1アドレス json形式はスナップショット
 *          ログはstderrとログファイルにだけ出す
 * @param[in] config_file YAML設定ファイルのパス
 * @param[out] out 結果の出力先
 * @return EXIT_SUCCESS (一覧が空, リゾルバ設定が読めない場合も含む)
 *         設定ファイルが読めない, ロガーが作れない場合はEXIT_FAILURE
 */
int run_app(const std::string& config_file, std::ostream& out);

#endif
