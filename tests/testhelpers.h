/*
 * testhelpers.h - Element factories shared by the test suites
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGESTAMP_TESTHELPERS_H
#define PAGESTAMP_TESTHELPERS_H

#include <QStringList>

#include "contentmodel.h"

namespace TestHelpers {

inline Content::Element paragraph(const QString &text)
{
    Content::Element el;
    el.kind = Content::ElementKind::Paragraph;
    el.text = text;
    return el;
}

inline Content::Element heading(const QString &text, int level = 1)
{
    Content::Element el;
    el.kind = Content::ElementKind::Heading;
    el.text = text;
    el.level = level;
    return el;
}

// `bodyRows` rows of short cells below one header row
inline Content::Element table(int bodyRows, int columns = 3)
{
    Content::TableData data;
    Content::TableRow header;
    header.isHeader = true;
    for (int c = 0; c < columns; ++c) {
        Content::TableCell cell;
        cell.text = QStringLiteral("Col %1").arg(c + 1);
        cell.isHeader = true;
        header.cells.append(cell);
    }
    data.rows.append(header);

    for (int r = 0; r < bodyRows; ++r) {
        Content::TableRow row;
        for (int c = 0; c < columns; ++c) {
            Content::TableCell cell;
            cell.text = QString::number(r * columns + c);
            row.cells.append(cell);
        }
        data.rows.append(row);
    }

    Content::Element el;
    el.kind = Content::ElementKind::Table;
    el.table = data;
    return el;
}

inline Content::Element image(qreal width, qreal height, const QByteArray &payload = QByteArray())
{
    Content::ImageData data;
    data.originalWidth = width;
    data.originalHeight = height;
    data.payload = payload;
    data.mimeType = QStringLiteral("image/png");
    data.altText = QStringLiteral("figure");

    Content::Element el;
    el.kind = Content::ElementKind::Image;
    el.text = data.altText;
    el.image = data;
    return el;
}

// `words` repetitions of "word", wrapped to 14 words per line at the default width
inline QString words(int count)
{
    QStringList list;
    for (int i = 0; i < count; ++i)
        list.append(QStringLiteral("word"));
    return list.join(QLatin1Char(' '));
}

} // namespace TestHelpers

#endif // PAGESTAMP_TESTHELPERS_H
