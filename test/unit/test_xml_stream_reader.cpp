#include "excelcsv/xml/XMLStreamReader.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace excelcsv {
namespace xml {

class XMLStreamReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        reader_ = std::make_unique<XMLStreamReader>();
        reader_->setStartElementCallback([this](std::string_view name, core::span<const XMLAttribute> attributes, int depth) {
            std::string entry = std::string(name) + "@" + std::to_string(depth);
            for (const auto& attr : attributes) {
                entry += " " + std::string(attr.name) + "=" + std::string(attr.value);
            }
            starts_.push_back(entry);
        });
        reader_->setEndElementCallback([this](std::string_view name, int /*depth*/) {
            ends_.emplace_back(name);
        });
        reader_->setTextCallback([this](std::string_view text, int /*depth*/) {
            texts_.emplace_back(text);
        });
    }

    std::unique_ptr<XMLStreamReader> reader_;
    std::vector<std::string> starts_;
    std::vector<std::string> ends_;
    std::vector<std::string> texts_;

    const std::string simple_xml_ = R"(<?xml version="1.0" encoding="UTF-8"?>
<root>
    <element attr="value">Text content</element>
    <empty_element/>
    <parent>
        <child id="1">Child text</child>
    </parent>
</root>)";
};

TEST_F(XMLStreamReaderTest, BasicParsing) {
    EXPECT_EQ(reader_->parseFromString(simple_xml_), XMLParseError::Ok);

    ASSERT_EQ(starts_.size(), 5u);
    EXPECT_EQ(starts_[0], "root@0");
    EXPECT_EQ(starts_[1], "element@1 attr=value");
    EXPECT_EQ(starts_[4], "child@2 id=1");

    EXPECT_EQ(ends_.back(), "root");
    EXPECT_EQ(texts_, (std::vector<std::string>{"Text content", "Child text"}));
    EXPECT_EQ(reader_->getElementsParsed(), 5u);
}

TEST_F(XMLStreamReaderTest, TextArrivesBeforeEndElement) {
    std::vector<std::string> events;
    reader_->setEndElementCallback([&](std::string_view name, int) { events.push_back("end:" + std::string(name)); });
    reader_->setTextCallback([&](std::string_view text, int) { events.push_back("text:" + std::string(text)); });

    EXPECT_EQ(reader_->parseFromString("<a><b>x</b></a>"), XMLParseError::Ok);
    EXPECT_EQ(events, (std::vector<std::string>{"text:x", "end:b", "end:a"}));
}

TEST_F(XMLStreamReaderTest, EntitiesAreDecodedOnce) {
    EXPECT_EQ(reader_->parseFromString("<t>a &amp;lt; b &lt; c &#x4E2D;</t>"), XMLParseError::Ok);
    ASSERT_EQ(texts_.size(), 1u);
    EXPECT_EQ(texts_[0], "a &lt; b < c \xE4\xB8\xAD");
}

TEST_F(XMLStreamReaderTest, WhitespaceTrimmingIsConfigurable) {
    EXPECT_EQ(reader_->parseFromString("<t>  padded  </t>"), XMLParseError::Ok);
    EXPECT_EQ(texts_.back(), "padded");

    reader_->setTrimWhitespace(false);
    EXPECT_EQ(reader_->parseFromString("<t>  padded  </t>"), XMLParseError::Ok);
    EXPECT_EQ(texts_.back(), "  padded  ");
}

TEST_F(XMLStreamReaderTest, IncrementalParsingAcrossChunks) {
    const std::string xml = "<root><item n=\"1\">alpha</item><item n=\"2\">beta</item></root>";
    ASSERT_EQ(reader_->beginParsing(), XMLParseError::Ok);
    for (size_t pos = 0; pos < xml.size(); pos += 7) {
        size_t len = std::min<size_t>(7, xml.size() - pos);
        ASSERT_EQ(reader_->feedData(xml.data() + pos, len), XMLParseError::Ok);
    }
    EXPECT_EQ(reader_->endParsing(), XMLParseError::Ok);

    EXPECT_EQ(texts_, (std::vector<std::string>{"alpha", "beta"}));
    EXPECT_EQ(starts_[2], "item@1 n=2");
    EXPECT_EQ(reader_->getBytesParsed(), xml.size());
}

TEST_F(XMLStreamReaderTest, MalformedInputReportsError) {
    std::string reported;
    reader_->setErrorCallback([&](XMLParseError, const std::string& message, int, int) { reported = message; });

    EXPECT_EQ(reader_->parseFromString("<root><open></root>"), XMLParseError::ParseFailed);
    EXPECT_EQ(reader_->getLastError(), XMLParseError::ParseFailed);
    EXPECT_FALSE(reader_->getLastErrorMessage().empty());
    EXPECT_EQ(reported, reader_->getLastErrorMessage());
}

TEST_F(XMLStreamReaderTest, EmptyInputIsRejected) {
    EXPECT_EQ(reader_->parseFromString(""), XMLParseError::InvalidInput);
}

TEST_F(XMLStreamReaderTest, CallbackExceptionPropagates) {
    reader_->setEndElementCallback([&](std::string_view name, int) {
        if (name == "stop") {
            throw std::runtime_error("callback failed");
        }
        ends_.emplace_back(name);
    });

    EXPECT_THROW(reader_->parseFromString("<root><a/><stop/><b/></root>"), std::runtime_error);
    // 抛出后不再派发后续事件
    EXPECT_EQ(ends_, (std::vector<std::string>{"a"}));

    // 同一个读取器可以继续使用
    ends_.clear();
    EXPECT_EQ(reader_->parseFromString("<root><a/></root>"), XMLParseError::Ok);
    EXPECT_EQ(ends_, (std::vector<std::string>{"a", "root"}));
}

}} // namespace excelcsv::xml
