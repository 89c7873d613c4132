#pragma once

#include "excelcsv/archive/ZipError.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace excelcsv {
namespace archive {

/**
 * @brief ZIP 读取器（基于 minizip-ng）
 *
 * 特性：
 * - 条目名缓存
 * - 流式读取，不需要把整个条目载入内存
 *
 * 同一实例不支持并发读取。
 */
class ZipReader {
public:
    // 数据回调 (data, size) -> 是否继续
    using ChunkCallback = std::function<bool(const uint8_t*, size_t)>;

    explicit ZipReader(const std::string& path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    /**
     * @brief 打开 ZIP 文件
     * @return NotOpen 以外的错误码表示失败原因
     */
    ZipError open();

    void close();

    bool isOpen() const { return is_open_; }

    /**
     * @brief 最近一次 minizip-ng 返回的原始错误码
     */
    int32_t getLastNativeError() const { return last_native_error_; }

    /**
     * @brief 条目是否存在（名称不区分大小写）
     */
    ZipError fileExists(std::string_view internal_path) const;

    /**
     * @brief 流式读取条目
     *
     * 回调返回 false 时提前结束（仍返回 Ok）。回调抛出的异常原样向上传播。
     */
    ZipError streamFile(std::string_view internal_path,
                        const ChunkCallback& callback,
                        size_t buffer_size = 65536) const;

    const std::string& getPath() const { return filepath_; }

private:
    void* unzip_handle_ = nullptr;
    std::string filepath_;
    bool is_open_ = false;
    int32_t last_native_error_ = 0;
    std::unordered_set<std::string> entry_names_;

    void cleanup();
    void buildEntryCache();
    bool hasEntry(std::string_view path) const;
    bool locateEntry(std::string_view path) const;
};

}} // namespace excelcsv::archive
