#include "fastword/archive/ZipReader.hpp"
#include "fastword/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <algorithm>
#include <cstring>

namespace fastword {
namespace archive {

ZipReader::ZipReader(const std::string& path) : filepath_(path) {
}

ZipReader::~ZipReader() {
    cleanup();
}

ZipError ZipReader::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();

    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return ZipError::IoFail;
    }

    int32_t result = mz_zip_reader_open_file(unzip_handle_, filepath_.c_str());
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip file for reading: {}, error: {}", filepath_, result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return (result == MZ_OPEN_ERROR || result == MZ_EXIST_ERROR) ? ZipError::IoFail : ZipError::BadFormat;
    }

    is_open_ = true;
    buildEntryCache();
    ARCHIVE_DEBUG("Zip archive opened for reading: {}, {} entries", filepath_, entries_.size());
    return ZipError::Ok;
}

void ZipReader::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();
}

std::vector<std::string> ZipReader::listFiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> files;
    files.reserve(entries_.size());
    for (const auto& entry : entries_) {
        files.push_back(entry.path);
    }
    return files;
}

ZipError ZipReader::fileExists(std::string_view internal_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_) {
        return ZipError::NotOpen;
    }
    return findEntry(internal_path) ? ZipError::Ok : ZipError::FileNotFound;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content, uint64_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    const EntryInfo* entry = findEntry(internal_path);
    if (!entry) {
        ARCHIVE_ERROR("File {} not found in zip archive", internal_path);
        return ZipError::FileNotFound;
    }

    if (max_size > 0 && entry->uncompressed_size > max_size) {
        ARCHIVE_ERROR("File {} is {} bytes, exceeds limit of {} bytes",
                      internal_path, entry->uncompressed_size, max_size);
        return ZipError::TooLarge;
    }

    std::string path_str(internal_path);
    if (mz_zip_reader_locate_entry(unzip_handle_, path_str.c_str(), 0) != MZ_OK) {
        return ZipError::FileNotFound;
    }

    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry: {}", internal_path);
        return ZipError::IoFail;
    }

    std::string buffer;
    buffer.resize(static_cast<size_t>(entry->uncompressed_size));
    size_t total_read = 0;
    while (total_read < buffer.size()) {
        size_t chunk = std::min<size_t>(buffer.size() - total_read, 1u << 30);
        int32_t read = mz_zip_reader_entry_read(unzip_handle_, &buffer[total_read], static_cast<int32_t>(chunk));
        if (read <= 0) {
            break;
        }
        total_read += static_cast<size_t>(read);
    }
    mz_zip_reader_entry_close(unzip_handle_);

    if (total_read != buffer.size()) {
        ARCHIVE_ERROR("Incomplete read for file {}, expected: {} bytes, read: {} bytes",
                      internal_path, buffer.size(), total_read);
        return ZipError::IoFail;
    }

    content.swap(buffer);
    ARCHIVE_DEBUG("Extracted file {} from zip, size: {} bytes", internal_path, content.size());
    return ZipError::Ok;
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    is_open_ = false;
    entries_.clear();
    entry_index_.clear();
}

void ZipReader::buildEntryCache() {
    entries_.clear();
    entry_index_.clear();

    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return;  // 空归档
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) != MZ_OK || !file_info) {
            continue;
        }
        if (!file_info->filename || file_info->filename[0] == '\0') {
            continue;
        }

        EntryInfo info;
        info.path = file_info->filename;
        info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
        info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
        info.crc32 = file_info->crc;
        info.compression_method = file_info->compression_method;
        info.modified_date = file_info->modified_date;
        info.is_directory = (info.path.back() == '/');

        // 重复条目只保留第一个，与 locate_entry 的结果一致
        if (entry_index_.count(info.path)) {
            ARCHIVE_WARN("Duplicate zip entry {}, keeping the first", info.path);
        } else {
            entry_index_[info.path] = entries_.size();
            entries_.push_back(std::move(info));
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);

    ARCHIVE_DEBUG("Built entry cache with {} entries", entries_.size());
}

const ZipReader::EntryInfo* ZipReader::findEntry(std::string_view path) const {
    auto it = entry_index_.find(std::string(path));
    return it != entry_index_.end() ? &entries_[it->second] : nullptr;
}

}} // namespace fastword::archive
