#pragma once

#include "excelcsv/archive/ZipReader.hpp"
#include "excelcsv/core/span.hpp"
#include "excelcsv/utils/CommonUtils.hpp"
#include "excelcsv/xml/XMLStreamReader.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace excelcsv {
namespace reader {

/**
 * @brief SAX 解析器基类
 *
 * 为各个 xlsx 部件解析器提供：
 * - 整块解析（parseXML）与从 ZIP 条目分块流式解析（parseStream）
 * - 元素栈、深度和文本收集
 * - 属性查找与单元格引用解析
 *
 * XML 或 ZIP 层的失败记录为错误状态并返回 false；
 * 子类回调抛出的异常不在此处拦截，原样传给调用方。
 */
class BaseSAXParser {
protected:
    struct ParseState {
        std::vector<std::string> element_stack;
        int current_depth = 0;
        std::string current_text;
        bool collecting_text = false;
        bool has_error = false;
        std::string error_message;

        void reset() {
            element_stack.clear();
            current_depth = 0;
            current_text.clear();
            collecting_text = false;
            has_error = false;
            error_message.clear();
        }
    };

    ParseState state_;

public:
    BaseSAXParser() = default;
    virtual ~BaseSAXParser() = default;

    BaseSAXParser(const BaseSAXParser&) = delete;
    BaseSAXParser& operator=(const BaseSAXParser&) = delete;

    /**
     * @brief 解析完整的 XML 内容
     * @return 是否解析成功
     */
    bool parseXML(const std::string& xml_content);

    /**
     * @brief 从 ZIP 条目分块解析，不在内存中保留整个部件
     * @return 是否解析成功；条目不存在时错误信息包含条目路径
     */
    bool parseStream(const archive::ZipReader& zip_reader, const std::string& internal_path);

    bool hasError() const { return state_.has_error; }
    const std::string& getErrorMessage() const { return state_.error_message; }

protected:
    /**
     * @brief 是否去除文本首尾空白（默认去除）
     */
    void setTrimText(bool trim) { trim_text_ = trim; }

    /**
     * @brief 每次解析开始前调用，子类在此重置自身状态
     */
    virtual void onParseBegin() {}

    virtual void handleStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int depth);
    virtual void handleEndElement(std::string_view name, int depth);
    virtual void handleText(std::string_view text, int depth);

    virtual void onStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int depth) = 0;
    virtual void onEndElement(std::string_view name, int depth) = 0;
    virtual void onText(std::string_view /*text*/, int /*depth*/) {}

    // ==================== 通用工具方法 ====================

    std::optional<std::string_view> findAttribute(core::span<const xml::XMLAttribute> attributes,
                                                  std::string_view name) const {
        for (const auto& attr : attributes) {
            if (attr.name == name) {
                return attr.value;
            }
        }
        return std::nullopt;
    }

    std::string getAttributeOr(core::span<const xml::XMLAttribute> attributes,
                               std::string_view name, const std::string& default_value) const {
        auto val = findAttribute(attributes, name);
        return val ? std::string(*val) : default_value;
    }

    /**
     * @brief 无符号整数属性（纯十进制数字）
     */
    std::optional<uint32_t> findUIntAttribute(core::span<const xml::XMLAttribute> attributes,
                                              std::string_view name) const;

    bool parseCellReference(std::string_view ref, uint32_t& row, uint32_t& col) const {
        return utils::CommonUtils::parseReference(ref, row, col);
    }

    void startCollectingText() {
        state_.collecting_text = true;
        state_.current_text.clear();
    }

    void stopCollectingText() {
        state_.collecting_text = false;
    }

    const std::string& getCurrentText() const {
        return state_.current_text;
    }

    void setError(const std::string& message);

    /**
     * @brief 去掉命名空间前缀（"x:row" -> "row"）
     */
    static std::string_view localName(std::string_view qualified_name);

    bool isInElement(std::string_view element_name) const;

    int getCurrentDepth() const {
        return state_.current_depth;
    }

private:
    void attachCallbacks(xml::XMLStreamReader& reader);

    bool trim_text_ = true;
};

}} // namespace excelcsv::reader
