#pragma once

#include "fastword/archive/ZipError.hpp"
#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>
#include <vector>
#include <mutex>
#include <unordered_map>

namespace fastword {
namespace archive {

/**
 * @brief 只读ZIP访问（minizip-ng）
 *
 * 特性：
 * - 线程安全
 * - 条目信息缓存，listFiles() 保持中央目录顺序
 * - 解压时检查大小上限
 */
class ZipReader {
public:
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint32_t crc32 = 0;
        int compression_method = 0;
        time_t modified_date = 0;
        bool is_directory = false;
    };

    explicit ZipReader(const std::string& path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    /**
     * 打开ZIP文件进行读取
     * @return Ok；文件不是ZIP或无法读取时为 BadFormat / IoFail
     */
    ZipError open();

    void close();

    bool isOpen() const { return is_open_; }

    const std::string& getPath() const { return filepath_; }

    /**
     * 获取所有文件列表（中央目录顺序）
     */
    std::vector<std::string> listFiles() const;

    /**
     * 检查文件是否存在
     * @return Ok / FileNotFound / NotOpen
     */
    ZipError fileExists(std::string_view internal_path) const;

    /**
     * 提取文件到字符串
     * @param max_size 解压后大小上限，0 表示不限制
     */
    ZipError extractFile(std::string_view internal_path, std::string& content, uint64_t max_size = 0);

private:
    void* unzip_handle_ = nullptr;
    std::string filepath_;
    bool is_open_ = false;
    mutable std::mutex mutex_;

    std::vector<EntryInfo> entries_;
    std::unordered_map<std::string, size_t> entry_index_;

    void cleanup();
    void buildEntryCache();
    const EntryInfo* findEntry(std::string_view path) const;
};

}} // namespace fastword::archive
