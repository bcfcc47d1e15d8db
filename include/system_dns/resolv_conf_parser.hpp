/**
 * @file resolv_conf_parser.hpp
 * @brief resolv.confのnameserver行の解析
 * @author sawada
 * @date 2026-10-19
 */

#ifndef RESOLV_CONF_PARSER_HPP_
#define RESOLV_CONF_PARSER_HPP_

#include <optional>
#include <string>
#include <vector>

/**
 * @class ResolvConfParser
 * @brief resolv.confの内容からDNSサーバアドレスの一覧を取り出す
 */
class ResolvConfParser {
    public:
        /**
         * @brief nameserver行を記述順に取り出す
         * @details glibcと同じく行頭から始まる行だけを読む(字下げした行は無視)
         *          不正なアドレスは読み飛ばす 重複は最初のものだけ残す
         * @param[in] text resolv.confの内容
         * @return inet_ntop形式のアドレス一覧
         */
        static std::vector<std::string> parse(const std::string& text);

        /**
         * @brief IPv4/IPv6アドレスとして正しいか
         * @details IPv6のゾーン指定(%eth0)は許可
         */
        static bool is_valid_address(const std::string& address);

        /**
         * @brief systemd-resolvedのスタブアドレスか(127.0.0.53, 127.0.0.54)
         */
        static bool is_stub_resolver_address(const std::string& address);

        /**
         * @brief アドレスをinet_ntop形式に正規化
         * @return 不正なアドレスならstd::nullopt
         */
        static std::optional<std::string> normalize_address(const std::string& address);
};

#endif
