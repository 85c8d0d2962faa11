/*
 * test_documentprocessor.cpp - End-to-end markup -> PDF
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "documentprocessor.h"
#include "recordingsurface.h"
#include "watermarkcompositor.h"

static QString reportMarkup()
{
    QString html;
    int n = 0;
    for (int section = 1; section <= 3; ++section) {
        html += QStringLiteral("<h1>Section %1</h1>").arg(section);
        for (int i = 0; i < 13; ++i)
            html += QStringLiteral("<p>Short paragraph number %1 of the report.</p>").arg(++n);
        if (section == 2) {
            html += QStringLiteral("<table><tr><th>Item</th><th>Amount</th></tr>");
            for (int r = 0; r < 11; ++r)
                html += QStringLiteral("<tr><td>Line %1</td><td>%2</td></tr>").arg(r).arg(r * 10);
            html += QStringLiteral("</table>");
        }
    }
    return html;
}

// MARK: - Normal documents

TEST(DocumentProcessorTest, SinglePageDocument) {
    DocumentProcessor processor;
    const ProcessingResult result = processor.process(
        QStringLiteral("<h1>Memo</h1><p>Please find the quarterly numbers attached.</p>"),
        Watermark::Settings());

    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.usedFallback);
    EXPECT_EQ(result.pageCount, 1);
    EXPECT_TRUE(result.breakIndices.isEmpty());
    EXPECT_TRUE(result.pdf.startsWith("%PDF-"));
    EXPECT_TRUE(result.pdf.contains("/Count 1"));
}

TEST(DocumentProcessorTest, MultiPageDocument) {
    DocumentProcessor processor;
    const ProcessingResult result = processor.process(reportMarkup(), Watermark::Settings());
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.usedFallback);
    EXPECT_GE(result.pageCount, 2);
    EXPECT_EQ(result.breakIndices.size(), result.pageCount - 1);
}

TEST(DocumentProcessorTest, SameInputSamePagination) {
    DocumentProcessor processor;
    const ProcessingResult first = processor.process(reportMarkup(), Watermark::Settings());
    const ProcessingResult second = processor.process(reportMarkup(), Watermark::Settings());
    EXPECT_EQ(first.pageCount, second.pageCount);
    EXPECT_EQ(first.breakIndices, second.breakIndices);
}

TEST(DocumentProcessorTest, ProgressCheckpoints) {
    DocumentProcessor processor;
    QList<int> percents;
    processor.setProgressCallback([&percents](const ProcessingProgress &p) {
        percents.append(p.percent);
    });
    processor.process(reportMarkup(), Watermark::Settings());

    ASSERT_GE(percents.size(), 5);
    EXPECT_EQ(percents[0], 15);
    EXPECT_EQ(percents[1], 35);
    EXPECT_EQ(percents[2], 60);
    EXPECT_TRUE(percents.contains(90));
    EXPECT_EQ(percents.last(), 100);
    for (int i = 1; i < percents.size(); ++i)
        EXPECT_LE(percents[i - 1], percents[i]);
}

TEST(DocumentProcessorTest, PageSetupIsUsed) {
    PageSetup setup;
    setup.pageSizeId = QPageSize::A4;
    DocumentProcessor processor;
    processor.setPageSetup(setup);
    const ProcessingResult result = processor.process(
        QStringLiteral("<p>An A4 page with a single paragraph of text.</p>"), Watermark::Settings());
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.pdf.contains("/MediaBox [0 0 595.00 842.00]"));
}

// MARK: - Fallback

TEST(DocumentProcessorTest, CorruptInputProducesWatermarkedNotice) {
    DocumentProcessor processor;
    QList<int> percents;
    processor.setProgressCallback([&percents](const ProcessingProgress &p) {
        percents.append(p.percent);
    });
    const ProcessingResult result = processor.process(QStringLiteral("\x01\x02 junk"),
                                                      Watermark::Settings());
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.usedFallback);
    EXPECT_EQ(result.pageCount, 1);
    EXPECT_FALSE(result.errorMessage.isEmpty());
    EXPECT_TRUE(result.pdf.contains("/Count 1"));
    EXPECT_EQ(percents.last(), 100);
}

TEST(DocumentProcessorTest, NoticePageCarriesWatermark) {
    Watermark::Settings settings;
    settings.templ = Watermark::Template::Draft;
    const Watermark::Compositor compositor(settings);

    RecordingSurface surface;
    DocumentProcessor::renderFallback(surface, compositor, QSizeF(612, 792),
                                      QStringLiteral("Extracted content is too short"));
    ASSERT_EQ(surface.pageCount(), 1);
    EXPECT_FALSE(surface.inPage);
    EXPECT_EQ(surface.textsMatching(0, QStringLiteral("Document Processing Notice")).size(), 1);
    EXPECT_EQ(surface.textsMatching(0, QStringLiteral("DRAFT COPY - Page 1 - DO NOT DISTRIBUTE")).size(), 1);
}

TEST(DocumentProcessorTest, EmptyInputFallsBack) {
    DocumentProcessor processor;
    const ProcessingResult result = processor.process(QString(), Watermark::Settings());
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.usedFallback);
    EXPECT_EQ(result.pageCount, 1);
}
