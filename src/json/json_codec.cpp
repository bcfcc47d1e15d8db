/**
 * @file json_codec.cpp
 * @brief json parse serialize (implementation)
 * @author sawada
 * @date 2026-10-19
 */

#include "json/json_codec.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
    constexpr int JSON_INDENT = 2;
}

void to_json(json& j, const dns_snapshot_t& p)
{
    j = json{
        { "source", p.source },
        { "available", p.available },
        { "servers", p.servers }
    };
}

void from_json(const json& j, dns_snapshot_t& p)
{
    j.at("source").get_to(p.source);
    j.at("available").get_to(p.available);
    j.at("servers").get_to(p.servers);
}

dns_snapshot_t JsonCodec::make_snapshot(const SystemDns::query_result& result)
{
    return dns_snapshot_t{
        result.source,
        result.state == SystemDns::query_state::SUCCESS,
        result.servers
    };
}

std::string JsonCodec::serialize_snapshot(const dns_snapshot_t& snapshot)
{
    json j = snapshot;

    return j.dump(JSON_INDENT);
}

dns_snapshot_t JsonCodec::parse_snapshot(const std::string& jsonString)
{
    json j = json::parse(jsonString);

    return j.get<dns_snapshot_t>();
}
