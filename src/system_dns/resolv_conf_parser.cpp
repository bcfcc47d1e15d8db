/**
 * @file resolv_conf_parser.cpp
 * @brief resolv.confのnameserver行の解析
 * @author sawada
 * @date 2026-10-19
 */

#include <arpa/inet.h>
#include <net/if.h>
#include <netinet/in.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

#include "logger/logger.hpp"
#include "system_dns/resolv_conf_parser.hpp"

namespace {
    constexpr const char* NAMESERVER_KEYWORD = "nameserver";

    constexpr const char* STUB_RESOLVER_ADDRESSES[] = {
        "127.0.0.53",
        "127.0.0.54"
    };

    bool is_blank(char c)
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
    }

    /**
     * @brief ゾーン指定の確認
     * @details インタフェース名(カーネルのdev_valid_nameと同じ規則)か数値のスコープID
     */
    bool is_valid_zone(const std::string& zone)
    {
        if (zone.empty() || zone.size() >= IFNAMSIZ) {
            return false;
        }

        if (zone == "." || zone == "..") {
            return false;
        }

        for (char c : zone) {
            if (c == '/' || c == ':' || std::isspace(static_cast<unsigned char>(c))) {
                return false;
            }
        }

        return true;
    }
}

std::vector<std::string> ResolvConfParser::parse(const std::string& text)
{
    std::vector<std::string> servers;

    std::istringstream stream(text);
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(stream, line)) {
        ++line_no;

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // glibcと同じく行頭から始まるキーワードだけを見る(字下げした行は無視)
        const std::string keyword(NAMESERVER_KEYWORD);

        if (line.compare(0, keyword.size(), keyword) != 0) {
            continue;
        }
        std::size_t pos = keyword.size();

        if (pos >= line.size()) {
            get_logger()->warn("resolv.conf line {}: nameserver without address", line_no);

            continue;
        }

        // "nameserverX" のような別キーワードは対象外
        if (!is_blank(line[pos])) {
            continue;
        }

        while (pos < line.size() && is_blank(line[pos])) {
            ++pos;
        }

        std::size_t end = pos;
        while (end < line.size() && !is_blank(line[end])) {
            ++end;
        }

        const std::string token = line.substr(pos, end - pos);

        if (token.empty()) {
            get_logger()->warn("resolv.conf line {}: nameserver without address", line_no);

            continue;
        }

        std::optional<std::string> address = normalize_address(token);
        if (!address.has_value()) {
            get_logger()->warn("resolv.conf line {}: skip malformed nameserver '{}'", line_no, token);

            continue;
        }

        if (std::find(servers.begin(), servers.end(), address.value()) != servers.end()) {
            get_logger()->debug("resolv.conf line {}: skip duplicate nameserver {}", line_no, address.value());

            continue;
        }

        servers.push_back(std::move(address.value()));
    }

    return servers;
}

bool ResolvConfParser::is_valid_address(const std::string& address)
{
    return normalize_address(address).has_value();
}

bool ResolvConfParser::is_stub_resolver_address(const std::string& address)
{
    std::optional<std::string> normalized = normalize_address(address);
    if (!normalized.has_value()) {
        return false;
    }

    for (const char* stub : STUB_RESOLVER_ADDRESSES) {
        if (normalized.value() == stub) {
            return true;
        }
    }

    return false;
}

std::optional<std::string> ResolvConfParser::normalize_address(const std::string& address)
{
    if (address.empty()) {
        return std::nullopt;
    }

    struct in_addr addr4;
    if (::inet_pton(AF_INET, address.c_str(), &addr4) == 1) {
        char ip_str[INET_ADDRSTRLEN];

        if (!::inet_ntop(AF_INET, &addr4, ip_str, sizeof(ip_str))) {
            return std::nullopt;
        }

        return std::string(ip_str);
    }

    std::string host = address;
    std::string zone;

    const std::size_t percent = address.find('%');
    if (percent != std::string::npos) {
        host = address.substr(0, percent);
        zone = address.substr(percent + 1);

        if (!is_valid_zone(zone)) {
            return std::nullopt;
        }
    }

    struct in6_addr addr6;
    if (::inet_pton(AF_INET6, host.c_str(), &addr6) != 1) {
        return std::nullopt;
    }

    char ip_str[INET6_ADDRSTRLEN];

    if (!::inet_ntop(AF_INET6, &addr6, ip_str, sizeof(ip_str))) {
        return std::nullopt;
    }

    std::string normalized(ip_str);

    if (!zone.empty()) {
        normalized += "%" + zone;
    }

    return normalized;
}
