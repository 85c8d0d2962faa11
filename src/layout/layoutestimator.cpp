/*
 * layoutestimator.cpp - Character-count footprint estimates
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "layoutestimator.h"

#include <QRegularExpression>
#include <QtMath>

namespace Layout {

qreal charWidth(qreal fontSize)
{
    return fontSize * 0.55;
}

qreal approxTextWidth(const QString &text, qreal fontSize)
{
    return text.size() * charWidth(fontSize);
}

QStringList wrapText(const QString &text, qreal maxWidth, qreal fontSize)
{
    static const QRegularExpression wsRe(QStringLiteral(R"(\s+)"));

    QStringList lines;
    const int maxChars = qMax(1, static_cast<int>(maxWidth / charWidth(fontSize)));
    QString current;

    const QStringList words = text.split(wsRe, Qt::SkipEmptyParts);
    for (QString word : words) {
        // Break words that cannot fit on any line
        while (word.size() > maxChars) {
            if (!current.isEmpty()) {
                lines.append(current);
                current.clear();
            }
            lines.append(word.left(maxChars));
            word = word.mid(maxChars);
        }
        if (word.isEmpty())
            continue;

        if (current.isEmpty()) {
            current = word;
        } else if (current.size() + 1 + word.size() <= maxChars) {
            current += QLatin1Char(' ') + word;
        } else {
            lines.append(current);
            current = word;
        }
    }
    if (!current.isEmpty())
        lines.append(current);
    return lines;
}

qreal headingFontSize(int level)
{
    switch (level) {
    case 1: return 20.0;
    case 2: return 18.0;
    case 3: return 16.0;
    case 4: return 14.0;
    case 5: return 13.0;
    default: return 12.0;
    }
}

qreal fontSizeFor(const Content::Element &el)
{
    switch (el.kind) {
    case Content::ElementKind::Heading:
        return headingFontSize(el.level);
    case Content::ElementKind::Table:
        return kCellFontSize;
    default:
        return kBodyFontSize;
    }
}

qreal lineHeightFor(const Content::Element &el, const PageConfig &config)
{
    if (el.kind == Content::ElementKind::Heading)
        return headingFontSize(el.level) * 1.3;
    return config.lineSpacing;
}

qreal trailingSpaceFor(const Content::Element &el, const PageConfig &config)
{
    switch (el.kind) {
    case Content::ElementKind::Heading:
        return headingFontSize(el.level) * 0.5 + config.paragraphSpacing;
    case Content::ElementKind::Paragraph:
        return config.paragraphSpacing;
    case Content::ElementKind::List:
        return kListItemSpacing;
    default:
        return 0;
    }
}

qreal textIndent(const Content::Element &el)
{
    if (el.kind == Content::ElementKind::List)
        return kListIndent * qMax(1, el.level);
    return 0;
}

QStringList textLines(const Content::Element &el, const PageConfig &config)
{
    QString text = el.text;
    if (el.kind == Content::ElementKind::List && !el.listMarker.isEmpty())
        text = el.listMarker + QLatin1Char(' ') + text;
    const qreal width = qMax(charWidth(fontSizeFor(el)),
                             config.contentWidth() - textIndent(el));
    return wrapText(text, width, fontSizeFor(el));
}

// --- Tables ---

TableMetrics measureTable(const Content::TableData &table, qreal availWidth)
{
    TableMetrics m;
    const int columns = table.columnCount();
    if (columns == 0)
        return m;

    // Column widths follow the longest cell of each column
    QList<int> longest(columns, 0);
    for (const auto &row : table.rows) {
        for (int c = 0; c < row.cells.size(); ++c)
            longest[c] = qMax(longest[c], static_cast<int>(row.cells[c].text.size()));
    }

    qreal total = 0;
    for (int c = 0; c < columns; ++c) {
        qreal w = qMax(kMinColumnWidth,
                       longest[c] * charWidth(kCellFontSize) + 2 * kCellPadding);
        m.columnWidths.append(w);
        total += w;
    }
    if (total > availWidth && total > 0) {
        const qreal scale = availWidth / total;
        for (auto &w : m.columnWidths)
            w = qFloor(w * scale);
    }

    for (const auto &row : table.rows) {
        qreal rowHeight = kMinRowHeight;
        for (int c = 0; c < row.cells.size(); ++c) {
            const qreal textWidth = qMax(charWidth(kCellFontSize),
                                         m.columnWidths[c] - 2 * kCellPadding);
            const int lines = qMax(1, static_cast<int>(
                wrapText(row.cells[c].text, textWidth, kCellFontSize).size()));
            rowHeight = qMax(rowHeight, lines * kCellLineHeight + kCellVerticalPadding);
        }
        m.rowHeights.append(rowHeight);
        m.height += rowHeight;
    }
    m.height += 2 * kTableMargin;
    return m;
}

// --- Images ---

QSizeF syntheticImageSize(qint64 encodedLength)
{
    const qreal base = qSqrt(qMax<qint64>(0, encodedLength) * 0.75);
    return QSizeF(qBound(200.0, base * 2.0, 600.0),
                  qBound(150.0, base * 1.5, 450.0));
}

QSizeF imageDisplaySize(const Content::ImageData &img, const PageConfig &config)
{
    QSizeF size;
    if (img.hasKnownSize()) {
        size = QSizeF(img.originalWidth, img.originalHeight);
    } else {
        const qint64 encodedLength = ((img.payload.size() + 2) / 3) * 4;
        size = syntheticImageSize(encodedLength);
    }

    const qreal maxWidth = config.contentWidth() * kImageMaxWidthFraction;
    const qreal maxHeight = config.usableHeight() * kImageMaxHeightFraction;
    const qreal scale = qMin(1.0, qMin(maxWidth / size.width(), maxHeight / size.height()));
    return size * scale;
}

// --- Heights ---

qreal estimateHeight(const Content::Element &el, const PageConfig &config)
{
    qreal height = 0;
    switch (el.kind) {
    case Content::ElementKind::Heading:
    case Content::ElementKind::Paragraph:
    case Content::ElementKind::List: {
        const int lines = textLines(el, config).size();
        if (lines > 0)
            height = lines * lineHeightFor(el, config) + trailingSpaceFor(el, config);
        break;
    }
    case Content::ElementKind::Table:
        if (el.table)
            height = measureTable(*el.table, config.contentWidth()).height;
        break;
    case Content::ElementKind::Image:
        if (el.image)
            height = imageDisplaySize(*el.image, config).height() + 2 * kImageMargin;
        break;
    case Content::ElementKind::Spacer:
        height = el.estimatedHeight > 0 ? el.estimatedHeight : kDefaultSpacerHeight;
        break;
    }
    return qMax(kMinimumHeight, height);
}

void estimate(Content::Element &el, const PageConfig &config)
{
    if (el.table) {
        const TableMetrics m = measureTable(*el.table, config.contentWidth());
        el.table->columnWidths = m.columnWidths;
        el.table->rowHeights = m.rowHeights;
        for (auto &row : el.table->rows) {
            for (int c = 0; c < row.cells.size(); ++c)
                row.cells[c].estimatedWidth = m.columnWidths.value(c);
        }
    }
    if (el.image) {
        const QSizeF display = imageDisplaySize(*el.image, config);
        el.image->displayWidth = display.width();
        el.image->displayHeight = display.height();
        el.image->aspectRatio = display.height() > 0 ? display.width() / display.height() : 1.0;
    }
    el.estimatedHeight = estimateHeight(el, config);
}

void estimateAll(Content::ElementList &elements, const PageConfig &config)
{
    for (auto &el : elements)
        estimate(el, config);
}

qreal gapAfter(Content::ElementKind kind)
{
    switch (kind) {
    case Content::ElementKind::Heading:   return 12.0;
    case Content::ElementKind::Paragraph: return 8.0;
    case Content::ElementKind::List:      return 4.0;
    case Content::ElementKind::Table:     return 16.0;
    case Content::ElementKind::Image:     return 12.0;
    case Content::ElementKind::Spacer:    return 0.0;
    }
    return 0.0;
}

// --- Slicing ---

static QList<Slice> sliceText(const Content::Element &el, const PageConfig &config)
{
    QList<Slice> slices;
    const int lineCount = textLines(el, config).size();
    const qreal lineHeight = lineHeightFor(el, config);
    const int perPage = qMax(1, static_cast<int>(config.usableHeight() / lineHeight));

    for (int first = 0; first < lineCount; first += perPage) {
        Slice s;
        s.firstUnit = first;
        s.unitCount = qMin(perPage, lineCount - first);
        s.height = s.unitCount * lineHeight;
        slices.append(s);
    }
    if (!slices.isEmpty())
        slices.last().height += trailingSpaceFor(el, config);
    return slices;
}

static QList<Slice> sliceTable(const Content::TableData &table, const PageConfig &config)
{
    QList<Slice> slices;
    const QList<qreal> &rowHeights = table.rowHeights;
    int headerCount = table.headerRowCount();
    if (headerCount >= rowHeights.size())
        headerCount = 0;

    qreal headerHeight = 0;
    for (int i = 0; i < headerCount; ++i)
        headerHeight += rowHeights[i];

    // Headers taller than half a page are only drawn on the first slice
    const qreal avail = config.usableHeight() - 2 * kTableMargin;
    const bool repeat = headerHeight <= config.usableHeight() * 0.5;

    Slice current;
    current.firstUnit = headerCount;
    current.repeatHeader = headerCount > 0;
    qreal currentHeight = headerHeight;

    for (int r = headerCount; r < rowHeights.size(); ++r) {
        if (currentHeight + rowHeights[r] > avail && current.unitCount > 0) {
            current.height = currentHeight + 2 * kTableMargin;
            slices.append(current);

            current = Slice();
            current.firstUnit = r;
            current.repeatHeader = repeat && headerCount > 0;
            currentHeight = current.repeatHeader ? headerHeight : 0;
        }
        currentHeight += rowHeights[r];
        ++current.unitCount;
    }
    current.height = currentHeight + 2 * kTableMargin;
    slices.append(current);
    return slices;
}

QList<Slice> sliceElement(const Content::Element &el, const PageConfig &config)
{
    const bool fits = el.estimatedHeight <= config.usableHeight();

    switch (el.kind) {
    case Content::ElementKind::Heading:
    case Content::ElementKind::Paragraph:
    case Content::ElementKind::List:
        if (!fits)
            return sliceText(el, config);
        return {Slice{0, static_cast<int>(textLines(el, config).size()), el.estimatedHeight, false}};
    case Content::ElementKind::Table:
        if (el.table) {
            if (!fits)
                return sliceTable(*el.table, config);
            const int headerCount = el.table->headerRowCount();
            return {Slice{headerCount, static_cast<int>(el.table->rows.size()) - headerCount,
                          el.estimatedHeight, headerCount > 0}};
        }
        break;
    default:
        break;
    }
    return {Slice{0, 1, el.estimatedHeight, false}};
}

} // namespace Layout
