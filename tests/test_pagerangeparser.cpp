/*
 * test_pagerangeparser.cpp - Page selection expressions
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "pagerangeparser.h"

// MARK: - Keywords

TEST(PageRangeParserTest, EmptyAndAllSelectEveryPage) {
    EXPECT_EQ(PageRangeParser::parse(QString(), 4).pages, QSet<int>({1, 2, 3, 4}));
    EXPECT_EQ(PageRangeParser::parse(QStringLiteral("All"), 3).pages, QSet<int>({1, 2, 3}));
}

TEST(PageRangeParserTest, OddAndEven) {
    EXPECT_EQ(PageRangeParser::parse(QStringLiteral("odd"), 5).pages, QSet<int>({1, 3, 5}));
    EXPECT_EQ(PageRangeParser::parse(QStringLiteral("even"), 5).pages, QSet<int>({2, 4}));
}

TEST(PageRangeParserTest, FirstAndLast) {
    auto r = PageRangeParser::parse(QStringLiteral("first, last"), 7);
    ASSERT_TRUE(r.valid);
    EXPECT_EQ(r.pages, QSet<int>({1, 7}));
}

TEST(PageRangeParserTest, LastMinusIsASinglePage) {
    auto r = PageRangeParser::parse(QStringLiteral("last-2"), 10);
    ASSERT_TRUE(r.valid);
    EXPECT_EQ(r.pages, QSet<int>({8}));
}

// MARK: - Ranges

TEST(PageRangeParserTest, NumbersAndRanges) {
    auto r = PageRangeParser::parse(QStringLiteral("1-3, 6"), 10);
    ASSERT_TRUE(r.valid);
    EXPECT_EQ(r.pages, QSet<int>({1, 2, 3, 6}));
}

TEST(PageRangeParserTest, RangeEndingAtLast) {
    auto r = PageRangeParser::parse(QStringLiteral("(last-1)-last"), 6);
    ASSERT_TRUE(r.valid);
    EXPECT_EQ(r.pages, QSet<int>({5, 6}));
}

TEST(PageRangeParserTest, PagesBeyondDocumentSelectNothing) {
    auto r = PageRangeParser::parse(QStringLiteral("2-9, 12"), 3);
    ASSERT_TRUE(r.valid);
    EXPECT_EQ(r.pages, QSet<int>({2, 3}));
}

TEST(PageRangeParserTest, RangeStartingPastShortDocumentSelectsNothing) {
    auto r = PageRangeParser::parse(QStringLiteral("1-3, 10-last"), 5);
    ASSERT_TRUE(r.valid);
    EXPECT_EQ(r.pages, QSet<int>({1, 2, 3}));
}

TEST(PageRangeParserTest, LastMinusClampsToFirstPage) {
    auto r = PageRangeParser::parse(QStringLiteral("(last-5)-last"), 3);
    ASSERT_TRUE(r.valid);
    EXPECT_EQ(r.pages, QSet<int>({1, 2, 3}));

    r = PageRangeParser::parse(QStringLiteral("last-9"), 4);
    ASSERT_TRUE(r.valid);
    EXPECT_EQ(r.pages, QSet<int>({1}));
}

// MARK: - Errors

TEST(PageRangeParserTest, ReversedRangeIsInvalid) {
    auto r = PageRangeParser::parse(QStringLiteral("5-2"), 10);
    EXPECT_FALSE(r.valid);
    EXPECT_FALSE(r.errorMessage.isEmpty());
}

TEST(PageRangeParserTest, GarbageIsInvalid) {
    auto r = PageRangeParser::parse(QStringLiteral("1, banana"), 10);
    EXPECT_FALSE(r.valid);
    EXPECT_TRUE(r.errorMessage.contains(QStringLiteral("banana")));
}
