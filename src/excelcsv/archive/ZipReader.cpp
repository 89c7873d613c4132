#include "excelcsv/archive/ZipReader.hpp"
#include "excelcsv/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <cctype>
#include <vector>

namespace excelcsv {
namespace archive {

namespace {

// 条目名按不区分大小写比较，与 locateEntry 保持一致
bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// 条目打开期间的守卫，回调抛出异常时同样关闭条目
class EntryGuard {
public:
    explicit EntryGuard(void* handle) : handle_(handle) {}
    ~EntryGuard() { mz_zip_reader_entry_close(handle_); }

    EntryGuard(const EntryGuard&) = delete;
    EntryGuard& operator=(const EntryGuard&) = delete;

private:
    void* handle_;
};

} // namespace

ZipReader::ZipReader(const std::string& path)
    : filepath_(path) {
}

ZipReader::~ZipReader() {
    cleanup();
}

ZipError ZipReader::open() {
    cleanup();

    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return ZipError::InternalError;
    }

    int32_t result = mz_zip_reader_open_file(unzip_handle_, filepath_.c_str());
    if (result != MZ_OK) {
        last_native_error_ = result;
        ARCHIVE_ERROR("Failed to open zip file for reading: {}, error: {}", filepath_, result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        if (result == MZ_OPEN_ERROR || result == MZ_EXIST_ERROR) {
            return ZipError::IoFail;
        }
        return ZipError::BadFormat;
    }

    is_open_ = true;
    ARCHIVE_DEBUG("Zip archive opened for reading: {}", filepath_);

    buildEntryCache();
    return ZipError::Ok;
}

void ZipReader::close() {
    cleanup();
}

ZipError ZipReader::fileExists(std::string_view internal_path) const {
    if (!is_open_) {
        return ZipError::NotOpen;
    }
    return hasEntry(internal_path) ? ZipError::Ok : ZipError::FileNotFound;
}

ZipError ZipReader::streamFile(std::string_view internal_path,
                               const ChunkCallback& callback,
                               size_t buffer_size) const {
    if (!callback || buffer_size == 0) {
        return ZipError::InvalidParameter;
    }
    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }
    if (!locateEntry(internal_path)) {
        ARCHIVE_DEBUG("File {} not found in zip archive", internal_path);
        return ZipError::FileNotFound;
    }

    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry: {}", internal_path);
        return ZipError::IoFail;
    }
    EntryGuard guard(unzip_handle_);

    std::vector<uint8_t> buffer(buffer_size);
    uint64_t total_read = 0;

    while (true) {
        int32_t bytes_read = mz_zip_reader_entry_read(unzip_handle_,
                                                      buffer.data(),
                                                      static_cast<int32_t>(buffer.size()));
        if (bytes_read < 0) {
            ARCHIVE_ERROR("Failed to read entry {}, error: {}", internal_path, bytes_read);
            return ZipError::IoFail;
        }
        if (bytes_read == 0) {
            break;
        }
        total_read += static_cast<uint64_t>(bytes_read);
        if (!callback(buffer.data(), static_cast<size_t>(bytes_read))) {
            ARCHIVE_DEBUG("Streaming of {} stopped by consumer after {} bytes", internal_path, total_read);
            return ZipError::Ok;
        }
    }

    ARCHIVE_DEBUG("Streamed file {} from zip, size: {} bytes", internal_path, total_read);
    return ZipError::Ok;
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    is_open_ = false;
    entry_names_.clear();
}

void ZipReader::buildEntryCache() {
    entry_names_.clear();

    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return;
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) == MZ_OK && file_info) {
            if (file_info->filename && file_info->filename[0] != '\0') {
                entry_names_.emplace(file_info->filename);
            }
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);

    ARCHIVE_DEBUG("Built entry cache with {} entries", entry_names_.size());
}

bool ZipReader::hasEntry(std::string_view path) const {
    if (entry_names_.count(std::string(path)) > 0) {
        return true;
    }
    for (const auto& name : entry_names_) {
        if (equalsIgnoreCase(name, path)) {
            return true;
        }
    }
    return false;
}

bool ZipReader::locateEntry(std::string_view path) const {
    if (!unzip_handle_) {
        return false;
    }
    std::string path_str(path);
    return mz_zip_reader_locate_entry(unzip_handle_, path_str.c_str(), 1) == MZ_OK;
}

}} // namespace excelcsv::archive
