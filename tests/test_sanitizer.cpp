#include "Sanitizer.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <vector>

using namespace opstrend;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInf = std::numeric_limits<double>::infinity();

} // namespace

TEST(Sanitizer, DropsNonFiniteValuesInOrder)
{
    const std::vector<double> raw{1.0, kNaN, 3.0, kInf, -kInf, 5.0};
    EXPECT_EQ(sanitize(raw), (std::vector<double>{1.0, 3.0, 5.0}));
}

TEST(Sanitizer, EmptyInputGivesEmptyOutput)
{
    EXPECT_TRUE(sanitize({}).empty());
    EXPECT_TRUE(sanitize_indexed({}).empty());
}

TEST(Sanitizer, AllInvalidGivesEmptyOutput)
{
    const std::vector<double> raw{kNaN, kInf, kNaN};
    EXPECT_TRUE(sanitize(raw).empty());
}

TEST(Sanitizer, IndexedKeepsRawPositions)
{
    const std::vector<double> raw{kNaN, 2.0, 4.0, kNaN, 8.0};
    const auto indexed = sanitize_indexed(raw);

    ASSERT_EQ(indexed.size(), 3u);
    EXPECT_EQ(indexed.values, (std::vector<double>{2.0, 4.0, 8.0}));
    EXPECT_EQ(indexed.source_index, (std::vector<std::size_t>{1, 2, 4}));
}

TEST(Sanitizer, DoesNotModifyInput)
{
    const std::vector<double> raw{1.0, kNaN, 2.0};
    const auto copy = sanitize(raw);
    EXPECT_EQ(raw.size(), 3u);
    EXPECT_EQ(copy.size(), 2u);
}
