/*
 * contentrenderer.cpp - Draw content elements on a Render::Surface
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "contentrenderer.h"

#include <QDebug>
#include <QStringList>

namespace Render {

static const QColor kTextColor(0x1a, 0x1a, 0x1a);
static const QColor kGridColor(0x99, 0x99, 0x99);
static const QColor kHeaderFill(0xf2, 0xf2, 0xf2);
static const QColor kPlaceholderColor = QColor::fromRgbF(0.5, 0.5, 0.5);
static constexpr qreal kGridWidth = 0.5;
static constexpr qreal kRuleWidth = 1.0;
static constexpr qreal kPlaceholderFontSize = 10.0;

ContentRenderer::ContentRenderer(Surface &surface, const Layout::PageConfig &config)
    : m_surface(surface)
    , m_config(config)
{
}

qreal ContentRenderer::surfaceY(qreal top) const
{
    return m_config.pageHeight - m_config.marginTop - top;
}

qreal ContentRenderer::alignedX(const QString &line, qreal fontSize, Qt::Alignment alignment,
                                qreal left, qreal width) const
{
    const qreal lineWidth = Layout::approxTextWidth(line, fontSize);
    if (alignment & Qt::AlignHCenter)
        return left + qMax(0.0, (width - lineWidth) / 2.0);
    if (alignment & Qt::AlignRight)
        return left + qMax(0.0, width - lineWidth);
    return left;
}

qreal ContentRenderer::draw(const Content::Element &el, const Layout::Slice &slice, qreal top)
{
    switch (el.kind) {
    case Content::ElementKind::Heading:
    case Content::ElementKind::Paragraph:
    case Content::ElementKind::List:
        drawTextElement(el, slice, top);
        break;
    case Content::ElementKind::Table:
        if (el.table)
            drawTable(*el.table, slice, top);
        break;
    case Content::ElementKind::Image:
        drawImage(el, top);
        break;
    case Content::ElementKind::Spacer: {
        // Spacers come from horizontal rules
        const qreal y = surfaceY(top + slice.height / 2.0);
        m_surface.drawLine(QPointF(m_config.marginLeft, y),
                           QPointF(m_config.marginLeft + m_config.contentWidth(), y),
                           kGridColor, kRuleWidth);
        break;
    }
    }
    return slice.height;
}

// --- Text ---

void ContentRenderer::drawTextElement(const Content::Element &el, const Layout::Slice &slice,
                                      qreal top)
{
    const QStringList lines = Layout::textLines(el, m_config);
    const qreal lineHeight = Layout::lineHeightFor(el, m_config);

    TextStyle style;
    style.font.size = Layout::fontSizeFor(el);
    style.font.bold = el.styleHints.bold || el.kind == Content::ElementKind::Heading;
    style.font.italic = el.styleHints.italic;
    style.color = kTextColor;

    const qreal left = m_config.marginLeft + Layout::textIndent(el);
    const qreal width = m_config.contentWidth() - Layout::textIndent(el);
    const int last = qMin(static_cast<int>(lines.size()), slice.firstUnit + slice.unitCount);

    for (int i = slice.firstUnit; i < last; ++i) {
        const qreal baseline = top + (i - slice.firstUnit) * lineHeight + lineHeight * 0.75;
        const qreal x = alignedX(lines[i], style.font.size, el.styleHints.alignment, left, width);
        m_surface.drawText(lines[i], QPointF(x, surfaceY(baseline)), style);
    }
}

// --- Tables ---

void ContentRenderer::drawTable(const Content::TableData &table, const Layout::Slice &slice,
                                qreal top)
{
    if (table.columnWidths.isEmpty() || table.rowHeights.size() != table.rows.size()) {
        qWarning() << "ContentRenderer: table without resolved metrics skipped";
        return;
    }

    qreal y = top + Layout::kTableMargin;
    if (slice.repeatHeader) {
        const int headerCount = table.headerRowCount();
        for (int r = 0; r < headerCount; ++r)
            y += drawTableRow(table, r, y);
    }
    const int last = qMin(static_cast<int>(table.rows.size()), slice.firstUnit + slice.unitCount);
    for (int r = slice.firstUnit; r < last; ++r)
        y += drawTableRow(table, r, y);
}

qreal ContentRenderer::drawTableRow(const Content::TableData &table, int row, qreal top)
{
    const Content::TableRow &tr = table.rows[row];
    const qreal rowHeight = table.rowHeights[row];

    TextStyle style;
    style.font.size = Layout::kCellFontSize;
    style.font.bold = tr.isHeader;
    style.color = kTextColor;

    qreal x = m_config.marginLeft;
    for (int c = 0; c < table.columnWidths.size(); ++c) {
        const qreal colWidth = table.columnWidths[c];
        const QRectF cellRect(x, surfaceY(top + rowHeight), colWidth, rowHeight);
        m_surface.drawRect(cellRect, tr.isHeader ? kHeaderFill : QColor(), kGridColor, kGridWidth);

        if (c < tr.cells.size()) {
            const Content::TableCell &cell = tr.cells[c];
            const qreal textWidth = colWidth - 2 * Layout::kCellPadding;
            const QStringList lines = Layout::wrapText(cell.text, textWidth, Layout::kCellFontSize);
            for (int i = 0; i < lines.size(); ++i) {
                const qreal baseline = top + Layout::kCellVerticalPadding / 2.0
                                     + i * Layout::kCellLineHeight + Layout::kCellFontSize;
                const qreal lx = alignedX(lines[i], style.font.size, cell.alignment,
                                          x + Layout::kCellPadding, textWidth);
                m_surface.drawText(lines[i], QPointF(lx, surfaceY(baseline)), style);
            }
        }
        x += colWidth;
    }
    return rowHeight;
}

// --- Images ---

void ContentRenderer::drawImage(const Content::Element &el, qreal top)
{
    if (!el.image)
        return;
    const Content::ImageData &img = *el.image;

    const qreal width = img.displayWidth;
    const qreal height = img.displayHeight;
    qreal x = m_config.marginLeft + (m_config.contentWidth() - width) / 2.0;
    if (img.alignment & Qt::AlignRight)
        x = m_config.marginLeft + m_config.contentWidth() - width;

    const qreal imageTop = top + Layout::kImageMargin;
    const QRectF rect(x, surfaceY(imageTop + height), width, height);
    if (!img.payload.isEmpty() && m_surface.drawImage(img.payload, img.mimeType, rect))
        return;

    // Not embeddable: keep a visible trace of the image instead
    ++m_placeholders;
    TextStyle style;
    style.font.size = kPlaceholderFontSize;
    style.color = kPlaceholderColor;
    m_surface.drawText(QStringLiteral("[Image: %1]").arg(img.altText),
                       QPointF(m_config.marginLeft, surfaceY(imageTop + kPlaceholderFontSize)),
                       style);
}

} // namespace Render
