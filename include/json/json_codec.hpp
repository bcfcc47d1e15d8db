/**
 * @file json_codec.hpp
 * @brief json parse serialize
 * @author sawada
 * @date 2026-10-19
 */

#ifndef JSON_CODEC_HPP_
#define JSON_CODEC_HPP_

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "system_dns/system_dns.hpp"

using json = nlohmann::json;

struct dns_snapshot_t {
    std::string source;

    bool available;

    std::vector<std::string> servers;
};

void to_json(json& j, const dns_snapshot_t& p);
void from_json(const json& j, dns_snapshot_t& p);

class JsonCodec {
    public:
        /**
         * @brief 取得結果からスナップショットを作る
         */
        static dns_snapshot_t make_snapshot(const SystemDns::query_result& result);

        static std::string serialize_snapshot(const dns_snapshot_t& snapshot);

        /**
         * @brief JSON文字列の解析
         * @details 不正なJSONやキー不足の場合はnlohmann::json::exceptionを投げる
         */
        static dns_snapshot_t parse_snapshot(const std::string& jsonString);
};

#endif
