/**
 * @file XLSXReader.cpp
 * @brief xlsx 工作簿数据源实现
 */

#include "excelcsv/reader/XLSXReader.hpp"
#include "excelcsv/core/Exception.hpp"
#include "excelcsv/reader/WorksheetParser.hpp"
#include "excelcsv/utils/ModuleLoggers.hpp"
#include "excelcsv/utils/TimeUtils.hpp"
#include <filesystem>
#include <fmt/format.h>

namespace excelcsv {
namespace reader {

namespace {

std::string directoryOf(const std::string& part_path) {
    size_t slash = part_path.find_last_of('/');
    return slash == std::string::npos ? std::string() : part_path.substr(0, slash);
}

} // namespace

XLSXReader::XLSXReader(const std::string& filename)
    : filename_(filename)
    , zip_reader_(std::make_unique<archive::ZipReader>(filename)) {
}

XLSXReader::~XLSXReader() {
    if (is_open_) {
        close();
    }
}

void XLSXReader::failOpen(const std::string& cause, core::ErrorCode code) {
    zip_reader_->close();
    is_open_ = false;
    EXCELCSV_THROW(core::SourceException, fmt::format("Cannot open workbook: {}.", cause), filename_, code);
}

void XLSXReader::open() {
    if (is_open_) {
        return;
    }

    utils::TimeUtils::PerformanceTimer timer;

    std::error_code ec;
    if (!std::filesystem::exists(filename_, ec)) {
        READER_ERROR("XLSX file not found: {}", filename_);
        failOpen(fmt::format("file not found: {}", filename_), core::ErrorCode::FileNotFound);
    }

    auto zip_result = zip_reader_->open();
    if (archive::isError(zip_result)) {
        READER_ERROR("Failed to open {} as zip archive: {} (native {})",
                     filename_, archive::toString(zip_result), zip_reader_->getLastNativeError());
        failOpen(archive::toString(zip_result),
                 zip_result == archive::ZipError::IoFail ? core::ErrorCode::FileReadError : core::ErrorCode::ZipError);
    }

    std::string workbook_path = locateWorkbookPart();
    std::string workbook_dir = directoryOf(workbook_path);

    loadWorkbook(workbook_path);
    loadSharedStrings(workbook_dir);
    loadStyles(workbook_dir);

    is_open_ = true;
    READER_INFO("Opened {}: {} sheet(s), {} shared strings, {} cell formats ({} ms)",
                filename_, workbook_parser_.getWorksheets().size(), shared_strings_.getStringCount(),
                styles_.getCellXfCount(), timer.elapsedMs());
}

void XLSXReader::close() {
    zip_reader_->close();
    is_open_ = false;
}

void XLSXReader::ensureOpen() {
    if (!is_open_) {
        open();
    }
}

std::string XLSXReader::locateWorkbookPart() {
    static const std::string kDefaultWorkbook = "xl/workbook.xml";

    if (archive::isError(zip_reader_->fileExists("_rels/.rels"))) {
        READER_DEBUG("No package relationships, assuming {}", kDefaultWorkbook);
        return kDefaultWorkbook;
    }

    RelationshipsParser package_relationships;
    if (!package_relationships.parseStream(*zip_reader_, "_rels/.rels")) {
        failOpen(package_relationships.getErrorMessage(), core::ErrorCode::XmlParseError);
    }

    const auto* office_document = package_relationships.findFirstByType("officeDocument");
    if (!office_document) {
        READER_WARN("Package relationships name no officeDocument, assuming {}", kDefaultWorkbook);
        return kDefaultWorkbook;
    }
    return RelationshipsParser::resolveTarget("", office_document->target);
}

void XLSXReader::loadWorkbook(const std::string& workbook_path) {
    if (archive::isError(zip_reader_->fileExists(workbook_path))) {
        failOpen(fmt::format("missing workbook part {}", workbook_path), core::ErrorCode::InvalidWorkbook);
    }

    std::string rels_path = RelationshipsParser::relsPathFor(workbook_path);
    if (archive::isSuccess(zip_reader_->fileExists(rels_path))) {
        if (!workbook_relationships_.parseStream(*zip_reader_, rels_path)) {
            failOpen(workbook_relationships_.getErrorMessage(), core::ErrorCode::XmlParseError);
        }
    } else {
        READER_WARN("Workbook relationships {} not found, using default sheet paths", rels_path);
    }

    workbook_parser_.setRelationships(&workbook_relationships_, directoryOf(workbook_path));
    if (!workbook_parser_.parseStream(*zip_reader_, workbook_path)) {
        failOpen(workbook_parser_.getErrorMessage(), core::ErrorCode::InvalidWorkbook);
    }

    date1904_ = workbook_parser_.isDate1904();
    if (date1904_) {
        READER_WARN("{} uses the 1904 date system; date serials are decoded with the 1900 epoch", filename_);
    }
}

std::string XLSXReader::partPathFor(const std::string& type_name, const std::string& workbook_dir,
                                    const std::string& fallback) const {
    const auto* rel = workbook_relationships_.findFirstByType(type_name);
    if (rel) {
        return RelationshipsParser::resolveTarget(workbook_dir, rel->target);
    }
    return workbook_dir.empty() ? fallback : workbook_dir + "/" + fallback;
}

void XLSXReader::loadSharedStrings(const std::string& workbook_dir) {
    std::string path = partPathFor("sharedStrings", workbook_dir, "sharedStrings.xml");
    if (archive::isError(zip_reader_->fileExists(path))) {
        // 只含数字的工作簿没有共享字符串表
        READER_DEBUG("No shared string table at {}", path);
        return;
    }
    if (!shared_strings_.parseStream(*zip_reader_, path)) {
        failOpen(shared_strings_.getErrorMessage(), core::ErrorCode::XmlParseError);
    }
}

void XLSXReader::loadStyles(const std::string& workbook_dir) {
    std::string path = partPathFor("styles", workbook_dir, "styles.xml");
    if (archive::isError(zip_reader_->fileExists(path))) {
        READER_DEBUG("No styles part at {}, numeric cells are not treated as dates", path);
        return;
    }
    if (!styles_.parseStream(*zip_reader_, path)) {
        failOpen(styles_.getErrorMessage(), core::ErrorCode::XmlParseError);
    }
}

const std::vector<WorksheetInfo>& XLSXReader::getWorksheets() {
    ensureOpen();
    return workbook_parser_.getWorksheets();
}

std::vector<std::string> XLSXReader::sheetNames() {
    ensureOpen();
    std::vector<std::string> names;
    names.reserve(workbook_parser_.getWorksheets().size());
    for (const auto& info : workbook_parser_.getWorksheets()) {
        names.push_back(info.name);
    }
    return names;
}

void XLSXReader::forEachRow(const std::string& sheet_name, const RowCallback& callback) {
    ensureOpen();

    const WorksheetInfo* target = nullptr;
    for (const auto& info : workbook_parser_.getWorksheets()) {
        if (info.name == sheet_name) {
            target = &info;
            break;
        }
    }
    if (!target) {
        EXCELCSV_THROW(core::WorksheetException, fmt::format("Cannot get worksheet data from {}", sheet_name),
                       sheet_name, core::ErrorCode::InvalidWorksheet);
    }

    utils::TimeUtils::PerformanceTimer timer;
    READER_DEBUG("Streaming sheet \"{}\" from {}", sheet_name, target->worksheet_path);

    WorksheetParser parser(&shared_strings_, &styles_);
    parser.setRowCallback(callback);
    if (!parser.parseStream(*zip_reader_, target->worksheet_path)) {
        READER_ERROR("Reading sheet \"{}\" failed: {}", sheet_name, parser.getErrorMessage());
        EXCELCSV_THROW(core::SourceException, fmt::format("Cannot get worksheet data from {}", sheet_name),
                       filename_, core::ErrorCode::InvalidWorksheet);
    }

    READER_DEBUG("Sheet \"{}\" streamed: {} rows in {} ms", sheet_name, parser.getRowsEmitted(), timer.elapsedMs());
}

}} // namespace excelcsv::reader
