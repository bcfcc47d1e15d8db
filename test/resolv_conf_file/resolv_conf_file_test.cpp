#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "system_dns/resolv_conf_file.hpp"

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

    void write_file(const std::filesystem::path& path, const std::string& text)
    {
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        ofs << text;
    }
}

int main()
{
    const std::filesystem::path dir =
        std::filesystem::temp_directory_path() / ("resolv_conf_file_test_" + std::to_string(::getpid()));

    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    const std::string content = "nameserver 8.8.8.8\nnameserver 1.1.1.1\n";

    /* ---------- 通常ファイル ---------- */
    {
        write_file(dir / "resolv.conf", content);

        ResolvConfFile file((dir / "resolv.conf").string());
        std::string text;

        expect(file.read(4096, text) == ResolvConfFile::read_state::SUCCESS, "regular file read");
        expect(text == content, "content matches");

        // 同じオブジェクトで再読み込み
        std::string again;
        expect(file.read(4096, again) == ResolvConfFile::read_state::SUCCESS && again == content, "read twice");
    }

    {
        write_file(dir / "empty.conf", "");

        ResolvConfFile file((dir / "empty.conf").string());
        std::string text = "stale";

        expect(file.read(4096, text) == ResolvConfFile::read_state::SUCCESS, "empty file read");
        expect(text.empty(), "empty file gives empty text");
    }

    /* ---------- 読めないもの ---------- */
    {
        ResolvConfFile file((dir / "missing.conf").string());
        std::string text = "stale";

        expect(file.read(4096, text) == ResolvConfFile::read_state::NOT_FOUND, "missing file");
        expect(text.empty(), "output cleared on failure");
    }

    {
        ResolvConfFile file((dir / "resolv.conf" / "child").string());
        std::string text;

        expect(file.read(4096, text) == ResolvConfFile::read_state::NOT_FOUND, "path through a regular file");
    }

    {
        ResolvConfFile file(dir.string());
        std::string text;

        expect(file.read(4096, text) == ResolvConfFile::read_state::NOT_REGULAR_FILE, "directory refused");
    }

    {
        const std::filesystem::path fifo = dir / "fifo.conf";

        if (::mkfifo(fifo.c_str(), 0600) == 0) {
            ResolvConfFile file(fifo.string());
            std::string text;

            expect(file.read(4096, text) == ResolvConfFile::read_state::NOT_REGULAR_FILE, "fifo refused without blocking");
        }
        else {
            std::cout << "[SKIP] mkfifo not available" << std::endl;
        }
    }

    {
        ResolvConfFile file((dir / "resolv.conf").string());
        std::string text;

        expect(file.read(content.size() - 1, text) == ResolvConfFile::read_state::TOO_LARGE, "size limit");
        expect(file.read(content.size(), text) == ResolvConfFile::read_state::SUCCESS, "size limit inclusive");
    }

    expect(std::string(ResolvConfFile::state_name(ResolvConfFile::read_state::TOO_LARGE)) == "TOO_LARGE", "state name");

    std::filesystem::remove_all(dir);

    return g_failed == 0 ? 0 : 1;
}
