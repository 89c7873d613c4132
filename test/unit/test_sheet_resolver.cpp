#include "excelcsv/core/Exception.hpp"
#include "excelcsv/core/SheetResolver.hpp"

#include <gtest/gtest.h>

namespace excelcsv {
namespace core {

class SheetResolverTest : public ::testing::Test {
protected:
    const std::vector<std::string> names_ = {"Alpha", "Beta", "Gamma"};
};

TEST_F(SheetResolverTest, ResolvesExactName) {
    EXPECT_EQ(SheetResolver::resolve("Beta", names_), "Beta");
    EXPECT_EQ(SheetResolver::resolve("Gamma", names_), "Gamma");
}

TEST_F(SheetResolverTest, ResolvesNonNegativeIndex) {
    for (size_t k = 0; k < names_.size(); ++k) {
        EXPECT_EQ(SheetResolver::resolve(std::to_string(k), names_), names_[k]);
    }
    EXPECT_EQ(SheetResolver::resolve("+1", names_), "Beta");
}

TEST_F(SheetResolverTest, NegativeIndexCountsFromEnd) {
    const size_t n = names_.size();
    for (size_t k = 1; k <= n; ++k) {
        EXPECT_EQ(SheetResolver::resolve("-" + std::to_string(k), names_), names_[n - k]);
    }
}

TEST_F(SheetResolverTest, NegativeIndexBeyondCountClampsToFirst) {
    EXPECT_EQ(SheetResolver::resolve("-4", names_), "Alpha");
    EXPECT_EQ(SheetResolver::resolve("-1000", names_), "Alpha");
}

TEST_F(SheetResolverTest, UnknownNameFallsBackToFirstSheet) {
    EXPECT_EQ(SheetResolver::resolve("nonexistent-name-and-not-a-number", names_), "Alpha");
    EXPECT_EQ(SheetResolver::resolve("", names_), "Alpha");
    EXPECT_EQ(SheetResolver::resolve("beta", names_), "Alpha");
}

TEST_F(SheetResolverTest, ExactNameTakesPrecedenceOverIndex) {
    const std::vector<std::string> numeric = {"Data", "Summary", "0"};
    EXPECT_EQ(SheetResolver::resolve("0", numeric), "0");
    EXPECT_EQ(SheetResolver::resolve("1", numeric), "Summary");
}

TEST_F(SheetResolverTest, IndexPastEndThrows) {
    try {
        SheetResolver::resolve("3", names_);
        FAIL() << "expected WorksheetException";
    } catch (const WorksheetException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::SheetIndexOutOfRange);
        EXPECT_EQ(e.getWorksheetName(), "3");
    }
}

TEST_F(SheetResolverTest, EmptyWorkbookThrows) {
    const std::vector<std::string> none;
    try {
        SheetResolver::resolve("0", none);
        FAIL() << "expected WorksheetException";
    } catch (const WorksheetException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::EmptyWorkbook);
    }
}

TEST_F(SheetResolverTest, ParseIndex) {
    int32_t value = 0;
    EXPECT_TRUE(SheetResolver::parseIndex("42", value));
    EXPECT_EQ(value, 42);
    EXPECT_TRUE(SheetResolver::parseIndex("-7", value));
    EXPECT_EQ(value, -7);
    EXPECT_TRUE(SheetResolver::parseIndex("-2147483648", value));
    EXPECT_EQ(value, INT32_MIN);

    EXPECT_FALSE(SheetResolver::parseIndex("", value));
    EXPECT_FALSE(SheetResolver::parseIndex("-", value));
    EXPECT_FALSE(SheetResolver::parseIndex("1.5", value));
    EXPECT_FALSE(SheetResolver::parseIndex(" 1", value));
    EXPECT_FALSE(SheetResolver::parseIndex("2147483648", value));
}

TEST_F(SheetResolverTest, NegativeIndexPosition) {
    EXPECT_EQ(SheetResolver::negativeIndexPosition(-1, 3), 2u);
    EXPECT_EQ(SheetResolver::negativeIndexPosition(-3, 3), 0u);
    EXPECT_EQ(SheetResolver::negativeIndexPosition(-5, 3), 0u);
    EXPECT_EQ(SheetResolver::negativeIndexPosition(INT32_MIN, 1), 0u);
}

}} // namespace excelcsv::core
