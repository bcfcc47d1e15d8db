/**
 * @file system_dns.cpp
 * @brief ホストに設定されているDNSサーバの取得
 * @author sawada
 * @date 2026-10-19
 */

#include <exception>
#include <system_error>
#include <utility>

#include "logger/logger.hpp"
#include "system_dns/resolv_conf_file.hpp"
#include "system_dns/resolv_conf_parser.hpp"
#include "system_dns/system_dns.hpp"

namespace {
    constexpr const char* DEFAULT_RESOLV_CONF_PATH = "/etc/resolv.conf";

    constexpr const char* DEFAULT_STUB_UPSTREAM_PATH = "/run/systemd/resolve/resolv.conf";

    constexpr std::size_t DEFAULT_MAX_FILE_BYTES = 64 * 1024;
}

SystemDns::SystemDns()
    : config_(default_config())
{
}

SystemDns::SystemDns(const resolver_config_t& config)
    : config_(config)
{
}

SystemDns::query_result SystemDns::query() const
{
    try {
        query_result result = read_servers(config_.resolv_conf_path);

        if (
            result.state == query_state::SUCCESS && config_.follow_stub_resolver &&
            !config_.stub_upstream_path.empty() && is_stub_only(result.servers)
        ) {
            get_logger()->debug("{} only lists the local stub resolver, reading {}", result.source, config_.stub_upstream_path);

            query_result upstream = read_servers(config_.stub_upstream_path);

            if (upstream.state == query_state::SUCCESS && !upstream.servers.empty()) {
                result = std::move(upstream);
            }
        }

        if (config_.max_nameservers > 0 && result.servers.size() > config_.max_nameservers) {
            result.servers.resize(config_.max_nameservers);
        }

        get_logger()->debug("{} dns servers from {}", result.servers.size(), result.source);

        return result;
    }
    catch (const std::exception& e) {
        get_logger()->error("SystemDns: query failed: {}", e.what());

        return query_result{ query_state::CONFIG_UNAVAILABLE, config_.resolv_conf_path, {} };
    }
}

std::vector<std::string> SystemDns::get_servers() const
{
    return query().servers;
}

std::future<std::vector<std::string>> SystemDns::get_servers_async() const
{
    resolver_config_t config = config_;

    try {
        return std::async(std::launch::async, [config]() {
            return SystemDns(config).get_servers();
        });
    }
    catch (const std::system_error& e) {
        // スレッドが作れない場合は呼び出し元のスレッドで取得して完了済みのfutureを返す
        get_logger()->warn("SystemDns: worker thread unavailable, querying synchronously: {}", e.what());

        std::promise<std::vector<std::string>> promise;
        promise.set_value(get_servers());

        return promise.get_future();
    }
}

const resolver_config_t& SystemDns::get_config() const
{
    return config_;
}

std::vector<std::string> SystemDns::get_system_dns_servers()
{
    return SystemDns().get_servers();
}

resolver_config_t SystemDns::default_config()
{
    resolver_config_t config;

    config.resolv_conf_path = DEFAULT_RESOLV_CONF_PATH;
    config.follow_stub_resolver = true;
    config.stub_upstream_path = DEFAULT_STUB_UPSTREAM_PATH;
    config.max_nameservers = 0;
    config.max_file_bytes = DEFAULT_MAX_FILE_BYTES;

    return config;
}

SystemDns::query_result SystemDns::read_servers(const std::string& path) const
{
    ResolvConfFile file(path);

    std::string text;

    const ResolvConfFile::read_state state = file.read(config_.max_file_bytes, text);

    if (state != ResolvConfFile::read_state::SUCCESS) {
        get_logger()->warn("Resolver config {} unavailable: {}", path, ResolvConfFile::state_name(state));

        return query_result{ query_state::CONFIG_UNAVAILABLE, path, {} };
    }

    return query_result{ query_state::SUCCESS, path, ResolvConfParser::parse(text) };
}

bool SystemDns::is_stub_only(const std::vector<std::string>& servers) const
{
    if (servers.empty()) {
        return false;
    }

    for (const auto& server : servers) {
        if (!ResolvConfParser::is_stub_resolver_address(server)) {
            return false;
        }
    }

    return true;
}
