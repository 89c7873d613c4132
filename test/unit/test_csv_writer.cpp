#include "excelcsv/core/CSVWriter.hpp"
#include "excelcsv/core/Exception.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace excelcsv {
namespace core {

class CSVWriterTest : public ::testing::Test {
protected:
    std::ostringstream out_;
};

TEST_F(CSVWriterTest, WritesPlainRecords) {
    CSVWriter writer(out_);
    writer.writeRecord({"a", "b", "c"});
    writer.writeRecord({"1", "2", "3"});
    writer.flush();
    EXPECT_EQ(out_.str(), "a,b,c\n1,2,3\n");
    EXPECT_EQ(writer.getRecordsWritten(), 2u);
}

TEST_F(CSVWriterTest, QuotesSpecialFields) {
    CSVWriter writer(out_);
    writer.writeRecord({"x,y", "say \"hi\"", "two\nlines", "cr\r", "plain"});
    EXPECT_EQ(out_.str(), "\"x,y\",\"say \"\"hi\"\"\",\"two\nlines\",\"cr\r\",plain\n");
}

TEST_F(CSVWriterTest, SingleEmptyFieldIsQuoted) {
    CSVWriter writer(out_);
    writer.writeRecord({""});
    EXPECT_EQ(out_.str(), "\"\"\n");
}

TEST_F(CSVWriterTest, EmptyFieldsAmongOthersAreBare) {
    CSVWriter writer(out_);
    writer.writeRecord({"", "", ""});
    EXPECT_EQ(out_.str(), ",,\n");
}

TEST_F(CSVWriterTest, CustomDelimiter) {
    CSVOptions options;
    options.delimiter = '\t';
    CSVWriter writer(out_, options);
    writer.writeRecord({"a,b", "c\td"});
    EXPECT_EQ(out_.str(), "a,b\t\"c\td\"\n");
}

TEST_F(CSVWriterTest, RaggedRecordRejectedWhenNotFlexible) {
    CSVWriter writer(out_);
    writer.writeRecord({"a", "b"});
    try {
        writer.writeRecord({"1", "2", "3"});
        FAIL() << "expected WriteException";
    } catch (const WriteException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::FieldCountMismatch);
        EXPECT_STREQ(e.what(), "found record with 3 fields, but the previous record has 2 fields");
    }
    // 之前写出的记录保留在输出中
    EXPECT_EQ(out_.str(), "a,b\n");
}

TEST_F(CSVWriterTest, RaggedRecordAcceptedWhenFlexible) {
    CSVOptions options;
    options.flexible = true;
    CSVWriter writer(out_, options);
    writer.writeRecord({"a", "b"});
    writer.writeRecord({"1"});
    writer.writeRecord({"1", "2", "3"});
    EXPECT_EQ(out_.str(), "a,b\n1\n1,2,3\n");
}

TEST_F(CSVWriterTest, FailedStreamRaisesWriteError) {
    CSVWriter writer(out_);
    out_.setstate(std::ios::badbit);
    EXPECT_THROW(writer.writeRecord({"a"}), WriteException);
}

TEST_F(CSVWriterTest, EscapeHelpers) {
    CSVWriter writer(out_);
    EXPECT_FALSE(writer.needsQuoting("simple"));
    EXPECT_TRUE(writer.needsQuoting("a,b"));
    EXPECT_EQ(writer.escapeField("\""), "\"\"\"\"");
    EXPECT_EQ(writer.formatRow({"a", "b c"}), "a,b c");
}

}} // namespace excelcsv::core
