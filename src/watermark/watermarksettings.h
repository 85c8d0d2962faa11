/*
 * watermarksettings.h - Watermark configuration
 *
 * Field names in fromJson/toJson follow the JSON settings files:
 *
 *   { "text": "...", "opacity": 30, "fontSize": "medium",
 *     "color": "#1e40af",
 *     "position": { "type": "corner", "corner": "bottom-right",
 *                   "offset": { "x": 0, "y": 0 } },
 *     "style": { "fontFamily": "helvetica", "rotationDeg": -30,
 *                "effects": { "shadow": {...}, "outline": {...} } },
 *     "transparency": { "type": "gradient", "value": { "start": 10, "end": 40 } },
 *     "pageSpecific": { "pageRange": "odd", "conditional": {...} },
 *     "template": "draft" }
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGESTAMP_WATERMARKSETTINGS_H
#define PAGESTAMP_WATERMARKSETTINGS_H

#include <QColor>
#include <QList>
#include <QPointF>
#include <QString>

#include <optional>

#include "rendersurface.h"

class QJsonObject;

namespace Watermark {

enum class PositionType { Center, Corner, Custom, Multiple };
enum class Corner { TopLeft, TopRight, BottomLeft, BottomRight };
enum class TransparencyType { Uniform, Gradient, Fade };
enum class PageRange { All, First, Last, Odd, Even, Pages };
enum class ContentLength { Short, Medium, Long };
enum class Template { None, Corporate, Confidential, Draft, Custom };
enum class FontSize { Small, Medium, Large };

struct Position {
    PositionType type = PositionType::Center;
    Corner corner = Corner::BottomRight;
    QList<QPointF> coordinates;     // custom: one instance per point
    QPointF offset;                 // corner: added to the corner origin
};

struct ShadowEffect {
    qreal offsetX = 2.0;
    qreal offsetY = -2.0;
    qreal blur = 0;                 // kept for round-tripping, not rendered
    QColor color = Qt::black;
};

struct OutlineEffect {
    qreal width = 1.0;
    QColor color = Qt::black;
};

struct Style {
    Render::FontFamily fontFamily = Render::FontFamily::Helvetica;
    std::optional<qreal> rotationDeg;
    std::optional<ShadowEffect> shadow;
    std::optional<OutlineEffect> outline;
};

struct Transparency {
    TransparencyType type = TransparencyType::Uniform;
    std::optional<qreal> value;     // uniform, fade
    qreal start = 10;               // gradient
    qreal end = 50;
};

struct Conditional {
    std::optional<bool> hasImages;
    std::optional<bool> hasTables;
    std::optional<ContentLength> contentLength;
};

struct PageSpecific {
    PageRange pageRange = PageRange::All;
    QList<int> pages;               // explicit 1-based numbers
    QString pageExpression;         // e.g. "1-3, last"; resolved per document
    std::optional<Conditional> conditional;
    QString customText;
};

struct Settings {
    QString text;
    qreal opacity = 30;             // percent, clamped on use
    FontSize fontSize = FontSize::Medium;
    qreal customFontSize = 0;       // > 0 overrides the named size
    QColor color = defaultColor();
    Position position;
    Style style;
    std::optional<Transparency> transparency;
    std::optional<PageSpecific> pageSpecific;
    Template templ = Template::None;
    QString organization = QStringLiteral("CPGS Corporation");

    qreal pointSize() const;
    Render::Font font() const;

    static QColor defaultColor() { return QColor(0x1e, 0x40, 0xaf); }
    static QColor parseColor(const QString &value);

    static Settings fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;
};

} // namespace Watermark

#endif // PAGESTAMP_WATERMARKSETTINGS_H
