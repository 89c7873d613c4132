#pragma once

#include "excelcsv/core/span.hpp"
#include <cstddef>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include <expat.h>

namespace excelcsv {
namespace xml {

/**
 * @brief 流式 XML 解析器，基于 libexpat
 *
 * SAX 事件回调：
 * - 开始元素：名称、属性、深度
 * - 结束元素：名称、深度
 * - 文本：在元素结束时（结束回调之前）一次性交付，遇到子元素开始时清空
 *
 * 支持整块解析和 beginParsing / feedData / endParsing 分块解析。
 */

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 解析失败
    MemoryError,           // 内存错误
    CallbackError          // 回调函数错误
};

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

constexpr bool isError(XMLParseError error) noexcept {
    return error != XMLParseError::Ok;
}

// XML 属性（视图指向 expat 内部缓冲区，仅在回调期间有效）
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v)
        : name(n), value(v) {}
};

class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, core::span<const XMLAttribute> attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;
    using ErrorCallback = std::function<void(XMLParseError error, const std::string& message, int line, int column)>;

    XMLStreamReader();
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    void setStartElementCallback(StartElementCallback callback);
    void setEndElementCallback(EndElementCallback callback);
    void setTextCallback(TextCallback callback);
    void setErrorCallback(ErrorCallback callback);

    // 默认去除文本首尾空白；单元格文本需要关闭
    void setTrimWhitespace(bool trim);
    void setCollectText(bool collect);

    /**
     * @brief 整块解析
     *
     * 回调中抛出的异常会中止解析，并在返回前原样重新抛出。
     */
    XMLParseError parseFromString(const std::string& xml_content);
    XMLParseError parseFromBuffer(const char* buffer, size_t size);

    // 分块解析
    XMLParseError beginParsing();
    XMLParseError feedData(const char* data, size_t size);
    XMLParseError endParsing();

    bool isParsing() const { return is_parsing_; }
    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    int getCurrentDepth() const { return current_depth_; }
    size_t getBytesParsed() const { return bytes_parsed_; }
    size_t getElementsParsed() const { return elements_parsed_; }

    int getCurrentLineNumber() const;
    int getCurrentColumnNumber() const;

private:
    XML_Parser parser_ = nullptr;

    bool is_parsing_ = false;
    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;

    // 回调抛出的异常，解析返回前重新抛出
    std::exception_ptr pending_exception_;

    std::vector<XMLAttribute> attribute_pool_;
    std::string current_text_;
    bool collecting_text_ = false;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;
    ErrorCallback error_callback_;

    bool trim_whitespace_ = true;
    bool collect_text_ = true;

    size_t bytes_parsed_ = 0;
    size_t elements_parsed_ = 0;

    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    XMLParseError parseChunk(const char* chunk, size_t size, bool is_final);
    core::span<const XMLAttribute> parseAttributes(const XML_Char** attrs);
    std::string_view trimStringView(std::string_view str) const;
    void handleError(XMLParseError error, const std::string& message);
    void captureCallbackException();
    void rethrowPendingException();
};

}} // namespace excelcsv::xml
