#include <iostream>
#include <string>
#include <vector>

#include "json/json_codec.hpp"

namespace {
    int g_failed = 0;

    void expect(bool cond, const std::string& what)
    {
        if (cond) {
            std::cout << "[ OK ] " << what << std::endl;
        }
        else {
            std::cerr << "[FAIL] " << what << std::endl;
            ++g_failed;
        }
    }
}

int main()
{
    /* ---------- 取得結果から ---------- */
    {
        SystemDns::query_result result{
            SystemDns::query_state::SUCCESS,
            "/etc/resolv.conf",
            { "8.8.8.8", "2001:4860:4860::8888" }
        };

        dns_snapshot_t snapshot = JsonCodec::make_snapshot(result);

        json j = json::parse(JsonCodec::serialize_snapshot(snapshot));

        expect(j.at("source") == "/etc/resolv.conf", "source serialized");
        expect(j.at("available") == true, "available serialized");
        expect(j.at("servers").is_array() && j.at("servers").size() == 2, "servers is an array");
        expect(j.at("servers")[0] == "8.8.8.8" && j.at("servers")[1] == "2001:4860:4860::8888", "server order kept");
    }

    {
        SystemDns::query_result result{ SystemDns::query_state::CONFIG_UNAVAILABLE, "/etc/resolv.conf", {} };

        json j = json::parse(JsonCodec::serialize_snapshot(JsonCodec::make_snapshot(result)));

        expect(j.at("available") == false, "unavailable serialized");
        expect(j.at("servers").is_array() && j.at("servers").empty(), "empty list is an empty array");
    }

    /* ---------- 解析 ---------- */
    {
        dns_snapshot_t snapshot = JsonCodec::parse_snapshot(
            R"({"source":"/run/systemd/resolve/resolv.conf","available":true,"servers":["1.1.1.1","9.9.9.9"]})"
        );

        expect(snapshot.source == "/run/systemd/resolve/resolv.conf", "source parsed");
        expect(snapshot.available, "available parsed");
        expect(snapshot.servers == std::vector<std::string>{ "1.1.1.1", "9.9.9.9" }, "servers parsed");
    }

    {
        bool thrown = false;

        try {
            JsonCodec::parse_snapshot(R"({"source":"/etc/resolv.conf","servers":[]})");
        }
        catch (const json::exception& e) {
            std::cout << "expected error: " << e.what() << std::endl;
            thrown = true;
        }

        expect(thrown, "missing key throws");
    }

    {
        bool thrown = false;

        try {
            JsonCodec::parse_snapshot("{not json");
        }
        catch (const json::exception& e) {
            std::cout << "expected error: " << e.what() << std::endl;
            thrown = true;
        }

        expect(thrown, "syntax error throws");
    }

    return g_failed == 0 ? 0 : 1;
}
