#include "excelcsv/reader/BaseSAXParser.hpp"
#include "excelcsv/utils/ModuleLoggers.hpp"
#include <fast_float/fast_float.h>
#include <fmt/format.h>

namespace excelcsv {
namespace reader {

void BaseSAXParser::attachCallbacks(xml::XMLStreamReader& reader) {
    reader.setTrimWhitespace(trim_text_);

    reader.setStartElementCallback([this](std::string_view name, core::span<const xml::XMLAttribute> attributes, int depth) {
        handleStartElement(name, attributes, depth);
    });
    reader.setEndElementCallback([this](std::string_view name, int depth) {
        handleEndElement(name, depth);
    });
    reader.setTextCallback([this](std::string_view text, int depth) {
        handleText(text, depth);
    });
    reader.setErrorCallback([this](xml::XMLParseError /*error*/, const std::string& message, int line, int column) {
        setError(fmt::format("XML parse error at line {}, column {}: {}", line, column, message));
    });
}

bool BaseSAXParser::parseXML(const std::string& xml_content) {
    state_.reset();
    onParseBegin();

    if (xml_content.empty()) {
        setError("Empty XML content");
        return false;
    }

    xml::XMLStreamReader reader;
    attachCallbacks(reader);

    auto result = reader.parseFromString(xml_content);
    if (xml::isError(result) && !state_.has_error) {
        setError(reader.getLastErrorMessage().empty() ? "XML parsing failed" : reader.getLastErrorMessage());
    }
    return !state_.has_error;
}

bool BaseSAXParser::parseStream(const archive::ZipReader& zip_reader, const std::string& internal_path) {
    state_.reset();
    onParseBegin();

    xml::XMLStreamReader reader;
    attachCallbacks(reader);

    if (xml::isError(reader.beginParsing())) {
        setError("Failed to initialize XML parser");
        return false;
    }

    auto err = zip_reader.streamFile(internal_path,
        [&reader](const uint8_t* data, size_t size) {
            return xml::isSuccess(reader.feedData(reinterpret_cast<const char*>(data), size));
        },
        1 << 16);

    if (archive::isError(err)) {
        setError(fmt::format("Cannot read {}: {}", internal_path, archive::toString(err)));
        return false;
    }
    if (state_.has_error) {
        return false;
    }

    if (xml::isError(reader.endParsing()) && !state_.has_error) {
        setError(fmt::format("Cannot parse {}: {}", internal_path, reader.getLastErrorMessage()));
    }
    return !state_.has_error;
}

std::string_view BaseSAXParser::localName(std::string_view qualified_name) {
    size_t colon = qualified_name.find(':');
    return colon == std::string_view::npos ? qualified_name : qualified_name.substr(colon + 1);
}

void BaseSAXParser::handleStartElement(std::string_view qualified_name, core::span<const xml::XMLAttribute> attributes, int depth) {
    // 部分生成器给 SpreadsheetML 元素加前缀（如 <x:row>）
    std::string_view name = localName(qualified_name);
    state_.element_stack.emplace_back(name);
    state_.current_depth = depth;
    state_.current_text.clear();
    onStartElement(name, attributes, depth);
}

void BaseSAXParser::handleEndElement(std::string_view qualified_name, int depth) {
    std::string_view name = localName(qualified_name);
    if (!state_.element_stack.empty()) {
        state_.element_stack.pop_back();
    }
    state_.current_depth = depth;
    onEndElement(name, depth);
    state_.current_text.clear();
}

void BaseSAXParser::handleText(std::string_view text, int depth) {
    if (state_.collecting_text) {
        state_.current_text.append(text.data(), text.size());
    }
    onText(text, depth);
}

std::optional<uint32_t> BaseSAXParser::findUIntAttribute(core::span<const xml::XMLAttribute> attributes,
                                                         std::string_view name) const {
    auto val = findAttribute(attributes, name);
    if (!val || val->empty()) {
        return std::nullopt;
    }
    uint32_t number = 0;
    auto result = fast_float::from_chars(val->data(), val->data() + val->size(), number);
    if (result.ec != std::errc{} || result.ptr != val->data() + val->size()) {
        return std::nullopt;
    }
    return number;
}

void BaseSAXParser::setError(const std::string& message) {
    if (state_.has_error) {
        return;
    }
    state_.has_error = true;
    state_.error_message = message;
    READER_ERROR("Parser error: {}", message);
}

bool BaseSAXParser::isInElement(std::string_view element_name) const {
    for (const auto& element : state_.element_stack) {
        if (element == element_name) {
            return true;
        }
    }
    return false;
}

}} // namespace excelcsv::reader
