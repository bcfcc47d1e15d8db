/**
 * @file resolv_conf_file.cpp
 * @brief resolv.conf読み込みクラス
 * @author sawada
 * @date 2026-10-19
 */

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "logger/logger.hpp"
#include "system_dns/resolv_conf_file.hpp"

namespace {
    constexpr std::size_t READ_CHUNK_SIZE = 4096;

    ResolvConfFile::read_state state_from_errno(int err)
    {
        switch (err) {
            case ENOENT:
            case ENOTDIR:
                return ResolvConfFile::read_state::NOT_FOUND;
            case EACCES:
            case EPERM:
                return ResolvConfFile::read_state::PERMISSION_DENIED;
            case EISDIR:
                return ResolvConfFile::read_state::NOT_REGULAR_FILE;
            default:
                return ResolvConfFile::read_state::READ_ERROR;
        }
    }
}

ResolvConfFile::ResolvConfFile(std::string path)
    : path_(std::move(path))
    , fd_(-1)
{
}

ResolvConfFile::~ResolvConfFile()
{
    close_fd();
}

ResolvConfFile::read_state ResolvConfFile::read(std::size_t max_bytes, std::string& out_text)
{
    out_text.clear();

    close_fd();

    do {
        fd_ = ::open(path_.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC | O_NOCTTY);
    } while (fd_ < 0 && errno == EINTR);

    if (fd_ < 0) {
        const int err = errno;

        get_logger()->debug("open({}) failed: {}", path_, std::strerror(err));

        return state_from_errno(err);
    }

    struct stat st;
    if (::fstat(fd_, &st) < 0) {
        get_logger()->debug("fstat({}) failed: {}", path_, std::strerror(errno));

        close_fd();

        return read_state::READ_ERROR;
    }

    if (!S_ISREG(st.st_mode)) {
        close_fd();

        return read_state::NOT_REGULAR_FILE;
    }

    if (static_cast<std::size_t>(st.st_size) > max_bytes) {
        close_fd();

        return read_state::TOO_LARGE;
    }

    std::string text;
    text.reserve(static_cast<std::size_t>(st.st_size));

    char buffer[READ_CHUNK_SIZE];

    while (true) {
        const ssize_t n = ::read(fd_, buffer, sizeof(buffer));

        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }

            get_logger()->debug("read({}) failed: {}", path_, std::strerror(errno));

            close_fd();

            return read_state::READ_ERROR;
        }

        if (n == 0) {
            break;
        }

        // 読み込み中にファイルが伸びた場合
        if (text.size() + static_cast<std::size_t>(n) > max_bytes) {
            close_fd();

            return read_state::TOO_LARGE;
        }

        text.append(buffer, static_cast<std::size_t>(n));
    }

    close_fd();

    out_text = std::move(text);

    return read_state::SUCCESS;
}

const std::string& ResolvConfFile::get_path() const
{
    return path_;
}

const char* ResolvConfFile::state_name(read_state state)
{
    switch (state) {
        case read_state::SUCCESS:
            return "SUCCESS";
        case read_state::NOT_FOUND:
            return "NOT_FOUND";
        case read_state::PERMISSION_DENIED:
            return "PERMISSION_DENIED";
        case read_state::NOT_REGULAR_FILE:
            return "NOT_REGULAR_FILE";
        case read_state::TOO_LARGE:
            return "TOO_LARGE";
        case read_state::READ_ERROR:
        default:
            return "READ_ERROR";
    }
}

void ResolvConfFile::close_fd()
{
    if (fd_ >= 0) {
        if (::close(fd_) < 0) {
            get_logger()->warn("Failed close {}: {}", path_, std::string(std::strerror(errno)));
        }

        fd_ = -1;
    }
}
