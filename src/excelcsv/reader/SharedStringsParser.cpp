#include "excelcsv/reader/SharedStringsParser.hpp"
#include "excelcsv/utils/ModuleLoggers.hpp"

namespace excelcsv {
namespace reader {

void SharedStringsParser::clear() {
    strings_.clear();
    current_item_.clear();
    in_si_ = false;
    phonetic_depth_ = 0;
}

void SharedStringsParser::onStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int /*depth*/) {
    if (name == "sst") {
        auto unique = findUIntAttribute(attributes, "uniqueCount");
        if (unique) {
            strings_.reserve(*unique);
        }
    } else if (name == "si") {
        in_si_ = true;
        current_item_.clear();
        phonetic_depth_ = 0;
    } else if (name == "rPh") {
        ++phonetic_depth_;
    } else if (name == "t" && in_si_ && phonetic_depth_ == 0) {
        startCollectingText();
    }
}

void SharedStringsParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "t") {
        if (state_.collecting_text) {
            current_item_ += getCurrentText();
            stopCollectingText();
        }
    } else if (name == "rPh") {
        if (phonetic_depth_ > 0) {
            --phonetic_depth_;
        }
    } else if (name == "si") {
        strings_.push_back(std::move(current_item_));
        current_item_.clear();
        in_si_ = false;
    } else if (name == "sst") {
        READER_DEBUG("Parsed {} shared strings", strings_.size());
    }
}

}} // namespace excelcsv::reader
