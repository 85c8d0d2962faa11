/*
 * rendersurface.h - Abstract page-drawing surface
 *
 * Coordinates are PDF points with the origin at the bottom-left corner
 * of the page. Text is drawn from its baseline origin and rotated
 * counter-clockwise by rotationDeg around that origin.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGESTAMP_RENDERSURFACE_H
#define PAGESTAMP_RENDERSURFACE_H

#include <QByteArray>
#include <QColor>
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QString>

namespace Render {

enum class FontFamily {
    Helvetica,
    Times,
    Courier,
};

struct Font {
    FontFamily family = FontFamily::Helvetica;
    bool bold = false;
    bool italic = false;
    qreal size = 12.0;

    bool operator==(const Font &o) const
    {
        return family == o.family && bold == o.bold && italic == o.italic
            && qFuzzyCompare(size, o.size);
    }
};

struct TextStyle {
    Font font;
    QColor color = Qt::black;
    qreal opacity = 1.0;        // 0..1
    qreal rotationDeg = 0;
};

class Surface {
public:
    virtual ~Surface() = default;

    virtual void beginPage(const QSizeF &size) = 0;
    virtual void endPage() = 0;

    virtual void drawText(const QString &text, const QPointF &origin,
                          const TextStyle &style) = 0;
    // Invalid colors skip the fill or the stroke.
    virtual void drawRect(const QRectF &rect, const QColor &fill,
                          const QColor &stroke, qreal strokeWidth = 1.0) = 0;
    virtual void drawLine(const QPointF &from, const QPointF &to,
                          const QColor &color, qreal width = 1.0) = 0;
    // Returns false when the payload cannot be decoded; nothing is drawn.
    virtual bool drawImage(const QByteArray &payload, const QString &mimeType,
                           const QRectF &rect) = 0;

    // Complete the artifact. Empty on failure.
    virtual QByteArray finish() = 0;

    virtual int pageCount() const = 0;
};

} // namespace Render

#endif // PAGESTAMP_RENDERSURFACE_H
