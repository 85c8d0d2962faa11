/*
 * contentmodel.h - Content element types (header-only)
 *
 * Flat, ordered representation of a document between markup parsing
 * and pagination. Footprint fields (estimatedHeight, column widths,
 * image display size) are filled once by the layout estimator and are
 * read-only afterwards.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGESTAMP_CONTENTMODEL_H
#define PAGESTAMP_CONTENTMODEL_H

#include <QByteArray>
#include <QList>
#include <QString>
#include <Qt>

#include <optional>

namespace Content {

enum class ElementKind {
    Heading,
    Paragraph,
    List,
    Table,
    Image,
    Spacer,
};

struct StyleHints {
    bool bold = false;
    bool italic = false;
    Qt::Alignment alignment = Qt::AlignLeft;
};

// --- Tables ---

struct TableCell {
    QString text;
    bool isHeader = false;
    Qt::Alignment alignment = Qt::AlignLeft;
    qreal estimatedWidth = 0;   // resolved column width
};

struct TableRow {
    QList<TableCell> cells;
    bool isHeader = false;
};

struct TableData {
    QList<TableRow> rows;
    QList<qreal> columnWidths;  // resolved by the estimator
    QList<qreal> rowHeights;    // resolved by the estimator

    int columnCount() const
    {
        int count = 0;
        for (const auto &row : rows)
            count = qMax(count, static_cast<int>(row.cells.size()));
        return count;
    }

    int headerRowCount() const
    {
        int count = 0;
        while (count < rows.size() && rows[count].isHeader)
            ++count;
        return count;
    }
};

// --- Images ---

struct ImageData {
    QByteArray payload;         // decoded bytes, empty when the source was not inline
    QString mimeType;
    QString altText;
    qreal originalWidth = 0;    // 0 = unknown
    qreal originalHeight = 0;
    qreal displayWidth = 0;
    qreal displayHeight = 0;
    qreal aspectRatio = 1.0;
    Qt::Alignment alignment = Qt::AlignHCenter;

    bool hasKnownSize() const { return originalWidth > 0 && originalHeight > 0; }
};

// --- Element ---

struct Element {
    ElementKind kind = ElementKind::Paragraph;
    QString text;
    int level = 0;              // heading level 1-6, list nesting level
    QString listMarker;         // "•" or "3." for list items
    StyleHints styleHints;
    qreal estimatedHeight = 0;
    int sourceOffset = 0;       // character position in the parsed document

    std::optional<TableData> table;
    std::optional<ImageData> image;

    bool isTextual() const
    {
        return kind == ElementKind::Paragraph || kind == ElementKind::Heading;
    }
};

using ElementList = QList<Element>;

inline QString kindName(ElementKind kind)
{
    switch (kind) {
    case ElementKind::Heading:   return QStringLiteral("heading");
    case ElementKind::Paragraph: return QStringLiteral("paragraph");
    case ElementKind::List:      return QStringLiteral("list");
    case ElementKind::Table:     return QStringLiteral("table");
    case ElementKind::Image:     return QStringLiteral("image");
    case ElementKind::Spacer:    return QStringLiteral("spacer");
    }
    return QString();
}

} // namespace Content

#endif // PAGESTAMP_CONTENTMODEL_H
