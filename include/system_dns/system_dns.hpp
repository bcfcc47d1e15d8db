/**
 * @file system_dns.hpp
 * @brief ホストに設定されているDNSサーバの取得
 * @author sawada
 * @date 2026-10-19
 */

#ifndef SYSTEM_DNS_HPP_
#define SYSTEM_DNS_HPP_

#include <cstddef>
#include <cstdint>
#include <future>
#include <string>
#include <vector>

struct resolver_config_t {
    std::string resolv_conf_path;

    bool follow_stub_resolver;
    std::string stub_upstream_path;

    // 0なら制限なし
    std::size_t max_nameservers;

    std::size_t max_file_bytes;
};

/**
 * @class SystemDns
 * @brief ホストのリゾルバ設定からDNSサーバアドレスを優先順に取得するクラス
 * @details 状態は構築時の設定のみなので複数スレッドから同時に呼び出してよい
 *          ホストの設定は読むだけで変更しない 結果はキャッシュしない
 */
class SystemDns {
    public:
        enum class query_state : std::uint8_t {
            SUCCESS,
            CONFIG_UNAVAILABLE
        };

        struct query_result {
            query_state state;

            // 一覧を読んだファイルのパス
            std::string source;

            std::vector<std::string> servers;
        };

        SystemDns();
        explicit SystemDns(const resolver_config_t& config);
        ~SystemDns() = default;

        /**
         * @brief DNSサーバの取得
         * @details 設定が読めない場合はCONFIG_UNAVAILABLEと空の一覧を返す
         * @return 取得結果
         */
        query_result query() const;

        /**
         * @brief DNSサーバの取得
         * @return アドレス一覧 設定が読めない場合は空
         */
        std::vector<std::string> get_servers() const;

        /**
         * @brief DNSサーバの取得をワーカースレッドで行う
         * @details 設定はコピーするのでこのオブジェクトが先に破棄されてもよい
         *          スレッドが作れない場合は例外を投げずに呼び出し元で取得し, 完了済みのfutureを返す
         */
        std::future<std::vector<std::string>> get_servers_async() const;

        const resolver_config_t& get_config() const;

        /**
         * @brief デフォルト設定(/etc/resolv.conf)でDNSサーバを取得
         * @return アドレス一覧 設定が読めない場合は空
         */
        static std::vector<std::string> get_system_dns_servers();

        static resolver_config_t default_config();
    private:
        /**
         * @brief 1ファイル分の読み込みと解析
         */
        query_result read_servers(const std::string& path) const;

        bool is_stub_only(const std::vector<std::string>& servers) const;

        resolver_config_t config_;
};

#endif
