/*
 * test_contentbuilder.cpp - Markup -> element list
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <QBuffer>
#include <QImage>

#include "contentbuilder.h"

using Content::ElementKind;

static QString pngDataUrl(int width, int height)
{
    QImage image(width, height, QImage::Format_RGB32);
    image.fill(Qt::red);
    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);
    image.save(&buffer, "PNG");
    return QStringLiteral("data:image/png;base64,") + QString::fromLatin1(bytes.toBase64());
}

// MARK: - Structure

TEST(ContentBuilderTest, PreservesDocumentOrder) {
    const QString html = QStringLiteral(
        "<h1>Quarterly Report</h1>"
        "<p>Opening paragraph with enough words.</p>"
        "<table><tr><th>Name</th><th>Value</th></tr><tr><td>A</td><td>1</td></tr></table>"
        "<ul><li>First point</li><li>Second point</li></ul>"
        "<p>Closing paragraph.</p>");

    ContentBuilder builder;
    auto result = builder.build(html);
    ASSERT_TRUE(result.valid);
    ASSERT_EQ(result.elements.size(), 6);

    EXPECT_EQ(result.elements[0].kind, ElementKind::Heading);
    EXPECT_EQ(result.elements[1].kind, ElementKind::Paragraph);
    EXPECT_EQ(result.elements[2].kind, ElementKind::Table);
    EXPECT_EQ(result.elements[3].kind, ElementKind::List);
    EXPECT_EQ(result.elements[4].kind, ElementKind::List);
    EXPECT_EQ(result.elements[5].kind, ElementKind::Paragraph);
    EXPECT_EQ(result.elements[5].text, QStringLiteral("Closing paragraph."));

    for (int i = 1; i < result.elements.size(); ++i)
        EXPECT_LE(result.elements[i - 1].sourceOffset, result.elements[i].sourceOffset);
}

TEST(ContentBuilderTest, HeadingLevels) {
    ContentBuilder builder;
    auto result = builder.build(QStringLiteral("<h2>Second level</h2><h4>Fourth level</h4>"));
    ASSERT_TRUE(result.valid);
    ASSERT_EQ(result.elements.size(), 2);
    EXPECT_EQ(result.elements[0].level, 2);
    EXPECT_EQ(result.elements[1].level, 4);
}

TEST(ContentBuilderTest, ListMarkers) {
    ContentBuilder builder;
    auto result = builder.build(QStringLiteral(
        "<ul><li>Bullet item</li></ul><ol><li>One</li><li>Two</li></ol>"));
    ASSERT_TRUE(result.valid);
    ASSERT_EQ(result.elements.size(), 3);
    EXPECT_EQ(result.elements[0].listMarker, QString(QChar(0x2022)));
    EXPECT_EQ(result.elements[1].listMarker, QStringLiteral("1."));
    EXPECT_EQ(result.elements[2].listMarker, QStringLiteral("2."));
}

TEST(ContentBuilderTest, DuplicateParagraphsAreKept) {
    ContentBuilder builder;
    auto result = builder.build(QStringLiteral("<p>Same text</p><p>Same text</p><p>Same text</p>"));
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.elements.size(), 3);
}

TEST(ContentBuilderTest, StyleHints) {
    ContentBuilder builder;
    auto result = builder.build(QStringLiteral(
        "<p align=\"center\"><b>Centered bold</b></p><p><i>Just italic</i></p>"));
    ASSERT_TRUE(result.valid);
    ASSERT_EQ(result.elements.size(), 2);
    EXPECT_TRUE(result.elements[0].styleHints.bold);
    EXPECT_TRUE(result.elements[0].styleHints.alignment & Qt::AlignHCenter);
    EXPECT_FALSE(result.elements[1].styleHints.bold);
    EXPECT_TRUE(result.elements[1].styleHints.italic);
}

// MARK: - Tables

TEST(ContentBuilderTest, TableRowsAndHeaders) {
    ContentBuilder builder;
    auto result = builder.build(QStringLiteral(
        "<table><tr><th>Item</th><th>Qty</th><th>Price</th></tr>"
        "<tr><td>Apple</td><td>3</td><td>1.20</td></tr>"
        "<tr><td>Pear</td><td>5</td><td>0.80</td></tr></table>"));
    ASSERT_TRUE(result.valid);
    ASSERT_EQ(result.elements.size(), 1);

    const auto &el = result.elements[0];
    ASSERT_EQ(el.kind, ElementKind::Table);
    ASSERT_TRUE(el.table.has_value());
    EXPECT_EQ(el.table->rows.size(), 3);
    EXPECT_EQ(el.table->columnCount(), 3);
    EXPECT_TRUE(el.table->rows[0].isHeader);
    EXPECT_FALSE(el.table->rows[1].isHeader);
    EXPECT_EQ(el.table->headerRowCount(), 1);
    EXPECT_EQ(el.table->rows[2].cells[0].text, QStringLiteral("Pear"));
}

TEST(ContentBuilderTest, TableTextIsNotRepeatedAsParagraphs) {
    ContentBuilder builder;
    auto result = builder.build(QStringLiteral(
        "<p>Before the table</p>"
        "<table><tr><td>Cell alpha</td><td>Cell beta</td></tr></table>"
        "<p>After the table</p>"));
    ASSERT_TRUE(result.valid);
    ASSERT_EQ(result.elements.size(), 3);
    for (const auto &el : result.elements) {
        if (el.kind == ElementKind::Paragraph)
            EXPECT_FALSE(el.text.contains(QStringLiteral("Cell alpha")));
    }
}

// MARK: - Images

TEST(ContentBuilderTest, InlineImageIsDecoded) {
    ContentBuilder builder;
    auto result = builder.build(QStringLiteral("<p>Figure follows</p><p><img src=\"%1\" title=\"Red box\"></p>")
                                    .arg(pngDataUrl(40, 20)));
    ASSERT_TRUE(result.valid);
    ASSERT_EQ(result.elements.size(), 2);

    const auto &el = result.elements[1];
    ASSERT_EQ(el.kind, ElementKind::Image);
    ASSERT_TRUE(el.image.has_value());
    EXPECT_EQ(el.image->mimeType, QStringLiteral("image/png"));
    EXPECT_FALSE(el.image->payload.isEmpty());
    EXPECT_EQ(el.image->originalWidth, 40);
    EXPECT_EQ(el.image->originalHeight, 20);
    EXPECT_FALSE(el.image->altText.isEmpty());
}

// MARK: - Fallbacks

TEST(ContentBuilderTest, ShortMarkupIsAnExtractionError) {
    ContentBuilder builder;
    auto result = builder.build(QStringLiteral("  <p>tiny</p>  "));
    EXPECT_FALSE(result.valid);
    EXPECT_FALSE(result.errorMessage.isEmpty());
    EXPECT_TRUE(result.elements.isEmpty());
}

TEST(ContentBuilderTest, PlainTextSplitsOnBlankLines) {
    ContentBuilder builder;
    auto result = builder.build(QStringLiteral(
        "First paragraph of plain text\nstill the first.\n\nSecond paragraph.\n\n\nThird."));
    ASSERT_TRUE(result.valid);
    EXPECT_TRUE(result.usedPlainText);
    ASSERT_EQ(result.elements.size(), 3);
    EXPECT_EQ(result.elements[0].text,
              QStringLiteral("First paragraph of plain text still the first."));
    EXPECT_EQ(result.elements[2].text, QStringLiteral("Third."));
}
