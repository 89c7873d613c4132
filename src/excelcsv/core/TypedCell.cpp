#include "excelcsv/core/TypedCell.hpp"

namespace excelcsv {
namespace core {

const char* cellErrorName(CellError error) noexcept {
    switch (error) {
        case CellError::Div0:        return "Div0";
        case CellError::NA:          return "NA";
        case CellError::Name:        return "Name";
        case CellError::Null:        return "Null";
        case CellError::Num:         return "Num";
        case CellError::Ref:         return "Ref";
        case CellError::Value:       return "Value";
        case CellError::GettingData: return "GettingData";
    }
    return "Unknown";
}

bool parseCellError(const std::string& text, CellError& out) noexcept {
    struct Entry {
        const char* text;
        CellError error;
    };
    static const Entry kEntries[] = {
        {"#DIV/0!", CellError::Div0},
        {"#N/A", CellError::NA},
        {"#NAME?", CellError::Name},
        {"#NULL!", CellError::Null},
        {"#NUM!", CellError::Num},
        {"#REF!", CellError::Ref},
        {"#VALUE!", CellError::Value},
        {"#GETTING_DATA", CellError::GettingData},
    };

    for (const auto& entry : kEntries) {
        if (text == entry.text) {
            out = entry.error;
            return true;
        }
    }
    return false;
}

namespace {

struct TypeNameVisitor {
    const char* operator()(const EmptyCell&) const noexcept { return "Empty"; }
    const char* operator()(const std::string&) const noexcept { return "Text"; }
    const char* operator()(int64_t) const noexcept { return "Integer"; }
    const char* operator()(double) const noexcept { return "Float"; }
    const char* operator()(bool) const noexcept { return "Boolean"; }
    const char* operator()(CellError) const noexcept { return "Error"; }
    const char* operator()(const DateTimeSerial&) const noexcept { return "DateTime"; }
};

} // namespace

const char* cellTypeName(const TypedCell& cell) noexcept {
    return std::visit(TypeNameVisitor{}, cell);
}

}} // namespace excelcsv::core
