/**
 * @file resolv_conf_file.hpp
 * @brief resolv.conf読み込みクラス
 * @author sawada
 * @date 2026-10-19
 */

#ifndef RESOLV_CONF_FILE_HPP_
#define RESOLV_CONF_FILE_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @class ResolvConfFile
 * @brief リゾルバ設定ファイルを読み取り専用で読み込むクラス
 * @details 通常ファイル以外(FIFO, デバイス, ディレクトリ)は読まないのでブロックしない
 *          ファイルディスクリプタはread()の中だけで保持する
 */
class ResolvConfFile {
    public:
        enum class read_state : std::uint8_t {
            SUCCESS,
            NOT_FOUND,
            PERMISSION_DENIED,
            NOT_REGULAR_FILE,
            TOO_LARGE,
            READ_ERROR
        };

        explicit ResolvConfFile(std::string path);
        ~ResolvConfFile();

        ResolvConfFile(const ResolvConfFile&) = delete;
        ResolvConfFile& operator=(const ResolvConfFile&) = delete;

        /**
         * @brief ファイル全体の読み込み
         * @param[in] max_bytes 読み込む最大サイズ これを超えるとTOO_LARGE
         * @param[out] out_text 読み込んだ内容 SUCCESS以外では空
         * @return 状態
         */
        read_state read(std::size_t max_bytes, std::string& out_text);

        const std::string& get_path() const;

        /**
         * @brief read_stateを文字列に変換(ログ用)
         */
        static const char* state_name(read_state state);
    private:
        void close_fd();

        std::string path_;
        int fd_;
};

#endif
