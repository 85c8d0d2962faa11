/*
 * layoutestimator.h - Character-count footprint estimates
 *
 * Glyph widths are approximated as a fixed fraction of the font size;
 * there is no shaping and no font metrics. Everything here is a pure
 * function of an element and the page configuration, so the paginator
 * and the renderer see identical line breaks.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGESTAMP_LAYOUTESTIMATOR_H
#define PAGESTAMP_LAYOUTESTIMATOR_H

#include <QList>
#include <QSizeF>
#include <QStringList>

#include "contentmodel.h"

namespace Layout {

// Page geometry plus the spacing chosen by the pagination strategy.
struct PageConfig {
    qreal pageWidth = 612.0;
    qreal pageHeight = 792.0;
    qreal marginTop = 72.0;
    qreal marginBottom = 72.0;
    qreal marginLeft = 72.0;
    qreal marginRight = 72.0;
    qreal lineSpacing = 16.0;
    qreal paragraphSpacing = 12.0;

    qreal contentWidth() const { return pageWidth - marginLeft - marginRight; }
    qreal usableHeight() const { return pageHeight - marginTop - marginBottom; }
};

// --- Typographic constants (points) ---

constexpr qreal kBodyFontSize = 12.0;
constexpr qreal kCellFontSize = 10.0;
constexpr qreal kCellLineHeight = 14.0;
constexpr qreal kCellPadding = 8.0;         // horizontal, each side
constexpr qreal kCellVerticalPadding = 10.0; // top + bottom
constexpr qreal kMinColumnWidth = 60.0;
constexpr qreal kMinRowHeight = 25.0;
constexpr qreal kTableMargin = 10.0;        // above and below the grid
constexpr qreal kListIndent = 18.0;
constexpr qreal kListItemSpacing = 4.0;
constexpr qreal kImageMargin = 10.0;
constexpr qreal kImageMaxWidthFraction = 0.8;
constexpr qreal kImageMaxHeightFraction = 0.6;
constexpr qreal kDefaultSpacerHeight = 10.0;
constexpr qreal kMinimumHeight = 1.0;

qreal charWidth(qreal fontSize);
qreal approxTextWidth(const QString &text, qreal fontSize);

// Greedy word wrap; words wider than maxWidth are broken.
QStringList wrapText(const QString &text, qreal maxWidth, qreal fontSize);

qreal headingFontSize(int level);
qreal fontSizeFor(const Content::Element &el);
qreal lineHeightFor(const Content::Element &el, const PageConfig &config);
qreal trailingSpaceFor(const Content::Element &el, const PageConfig &config);

// Wrapped lines of a text element (list marker included).
QStringList textLines(const Content::Element &el, const PageConfig &config);
qreal textIndent(const Content::Element &el);

struct TableMetrics {
    QList<qreal> columnWidths;
    QList<qreal> rowHeights;
    qreal height = 0;
};

TableMetrics measureTable(const Content::TableData &table, qreal availWidth);

// Unknown pixel size: synthetic estimate from the base64 payload length.
QSizeF syntheticImageSize(qint64 encodedLength);
QSizeF imageDisplaySize(const Content::ImageData &img, const PageConfig &config);

qreal estimateHeight(const Content::Element &el, const PageConfig &config);

// Resolve the footprint of every element in place.
void estimate(Content::Element &el, const PageConfig &config);
void estimateAll(Content::ElementList &elements, const PageConfig &config);

// Vertical gap the paginator leaves after an element of this kind.
qreal gapAfter(Content::ElementKind kind);

// --- Oversized elements ---

// A piece of an element taller than the usable page height. Units are
// wrapped lines for text and body rows for tables.
struct Slice {
    int firstUnit = 0;
    int unitCount = 0;
    qreal height = 0;
    bool repeatHeader = false;  // tables: header rows drawn above the slice
};

QList<Slice> sliceElement(const Content::Element &el, const PageConfig &config);

} // namespace Layout

#endif // PAGESTAMP_LAYOUTESTIMATOR_H
