/*
 * watermarksettings.cpp - JSON serialization for watermark settings
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "watermarksettings.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonObject>
#include <QRegularExpression>

namespace Watermark {

// ---------------------------------------------------------------------------
// Enum <-> string helpers
// ---------------------------------------------------------------------------

static Corner cornerFromString(const QString &s)
{
    if (s == QLatin1String("top-left"))    return Corner::TopLeft;
    if (s == QLatin1String("top-right"))   return Corner::TopRight;
    if (s == QLatin1String("bottom-left")) return Corner::BottomLeft;
    return Corner::BottomRight;
}

static QString cornerToString(Corner c)
{
    switch (c) {
    case Corner::TopLeft:     return QStringLiteral("top-left");
    case Corner::TopRight:    return QStringLiteral("top-right");
    case Corner::BottomLeft:  return QStringLiteral("bottom-left");
    case Corner::BottomRight: return QStringLiteral("bottom-right");
    }
    return QString();
}

static PositionType positionTypeFromString(const QString &s)
{
    if (s == QLatin1String("corner"))   return PositionType::Corner;
    if (s == QLatin1String("custom"))   return PositionType::Custom;
    if (s == QLatin1String("multiple")) return PositionType::Multiple;
    if (s != QLatin1String("center") && !s.isEmpty())
        qWarning() << "WatermarkSettings: unknown position type" << s;
    return PositionType::Center;
}

static QString positionTypeToString(PositionType t)
{
    switch (t) {
    case PositionType::Center:   return QStringLiteral("center");
    case PositionType::Corner:   return QStringLiteral("corner");
    case PositionType::Custom:   return QStringLiteral("custom");
    case PositionType::Multiple: return QStringLiteral("multiple");
    }
    return QString();
}

static Render::FontFamily fontFamilyFromString(const QString &s)
{
    const QString lower = s.toLower();
    if (lower == QLatin1String("times"))   return Render::FontFamily::Times;
    if (lower == QLatin1String("courier")) return Render::FontFamily::Courier;
    return Render::FontFamily::Helvetica;
}

static QString fontFamilyToString(Render::FontFamily f)
{
    switch (f) {
    case Render::FontFamily::Helvetica: return QStringLiteral("helvetica");
    case Render::FontFamily::Times:     return QStringLiteral("times");
    case Render::FontFamily::Courier:   return QStringLiteral("courier");
    }
    return QString();
}

static PageRange pageRangeFromString(const QString &s)
{
    if (s == QLatin1String("first")) return PageRange::First;
    if (s == QLatin1String("last"))  return PageRange::Last;
    if (s == QLatin1String("odd"))   return PageRange::Odd;
    if (s == QLatin1String("even"))  return PageRange::Even;
    return PageRange::All;
}

static QString pageRangeToString(PageRange r)
{
    switch (r) {
    case PageRange::All:   return QStringLiteral("all");
    case PageRange::First: return QStringLiteral("first");
    case PageRange::Last:  return QStringLiteral("last");
    case PageRange::Odd:   return QStringLiteral("odd");
    case PageRange::Even:  return QStringLiteral("even");
    case PageRange::Pages: return QString();
    }
    return QString();
}

static ContentLength contentLengthFromString(const QString &s)
{
    if (s == QLatin1String("short")) return ContentLength::Short;
    if (s == QLatin1String("long"))  return ContentLength::Long;
    return ContentLength::Medium;
}

static QString contentLengthToString(ContentLength l)
{
    switch (l) {
    case ContentLength::Short:  return QStringLiteral("short");
    case ContentLength::Medium: return QStringLiteral("medium");
    case ContentLength::Long:   return QStringLiteral("long");
    }
    return QString();
}

static Template templateFromString(const QString &s)
{
    if (s == QLatin1String("corporate"))    return Template::Corporate;
    if (s == QLatin1String("confidential")) return Template::Confidential;
    if (s == QLatin1String("draft"))        return Template::Draft;
    if (s == QLatin1String("custom"))       return Template::Custom;
    return Template::None;
}

static QString templateToString(Template t)
{
    switch (t) {
    case Template::None:         return QString();
    case Template::Corporate:    return QStringLiteral("corporate");
    case Template::Confidential: return QStringLiteral("confidential");
    case Template::Draft:        return QStringLiteral("draft");
    case Template::Custom:       return QStringLiteral("custom");
    }
    return QString();
}

static QPointF pointFromJson(const QJsonObject &obj)
{
    return QPointF(obj.value(QLatin1String("x")).toDouble(),
                   obj.value(QLatin1String("y")).toDouble());
}

static QJsonObject pointToJson(const QPointF &p)
{
    QJsonObject obj;
    obj[QLatin1String("x")] = p.x();
    obj[QLatin1String("y")] = p.y();
    return obj;
}

// ---------------------------------------------------------------------------
// Settings
// ---------------------------------------------------------------------------

qreal Settings::pointSize() const
{
    if (customFontSize > 0)
        return customFontSize;
    switch (fontSize) {
    case FontSize::Small:  return 36.0;
    case FontSize::Medium: return 48.0;
    case FontSize::Large:  return 64.0;
    }
    return 48.0;
}

Render::Font Settings::font() const
{
    Render::Font f;
    f.family = style.fontFamily;
    f.bold = (customFontSize <= 0 && fontSize == FontSize::Large);
    f.size = pointSize();
    return f;
}

QColor Settings::parseColor(const QString &value)
{
    static const QRegularExpression hexRe(QStringLiteral("^#[0-9a-fA-F]{6}$"));
    if (hexRe.match(value.trimmed()).hasMatch())
        return QColor(value.trimmed());
    if (!value.isEmpty())
        qWarning() << "WatermarkSettings: unsupported color" << value << "- using default";
    return defaultColor();
}

Settings Settings::fromJson(const QJsonObject &obj)
{
    Settings s;
    s.text = obj.value(QLatin1String("text")).toString();
    s.opacity = obj.value(QLatin1String("opacity")).toDouble(30.0);

    const QJsonValue sizeVal = obj.value(QLatin1String("fontSize"));
    if (sizeVal.isDouble()) {
        s.customFontSize = sizeVal.toDouble();
    } else {
        const QString size = sizeVal.toString();
        if (size == QLatin1String("small"))      s.fontSize = FontSize::Small;
        else if (size == QLatin1String("large")) s.fontSize = FontSize::Large;
        else                                     s.fontSize = FontSize::Medium;
    }

    if (obj.contains(QLatin1String("color")))
        s.color = parseColor(obj.value(QLatin1String("color")).toString());

    if (obj.contains(QLatin1String("position"))) {
        const QJsonObject p = obj.value(QLatin1String("position")).toObject();
        s.position.type = positionTypeFromString(p.value(QLatin1String("type")).toString());
        s.position.corner = cornerFromString(p.value(QLatin1String("corner")).toString());
        if (p.contains(QLatin1String("offset")))
            s.position.offset = pointFromJson(p.value(QLatin1String("offset")).toObject());

        // "coordinates" may be a single point or a list of points
        const QJsonValue coords = p.value(QLatin1String("coordinates"));
        if (coords.isArray()) {
            for (const QJsonValue &v : coords.toArray())
                s.position.coordinates.append(pointFromJson(v.toObject()));
        } else if (coords.isObject()) {
            s.position.coordinates.append(pointFromJson(coords.toObject()));
        }
    }

    if (obj.contains(QLatin1String("style"))) {
        const QJsonObject st = obj.value(QLatin1String("style")).toObject();
        s.style.fontFamily = fontFamilyFromString(st.value(QLatin1String("fontFamily")).toString());
        if (st.value(QLatin1String("rotationDeg")).isDouble())
            s.style.rotationDeg = st.value(QLatin1String("rotationDeg")).toDouble();
        else if (st.value(QLatin1String("rotation")).isDouble())
            s.style.rotationDeg = st.value(QLatin1String("rotation")).toDouble();

        const QJsonObject fx = st.value(QLatin1String("effects")).toObject();
        if (fx.contains(QLatin1String("shadow"))) {
            const QJsonObject sh = fx.value(QLatin1String("shadow")).toObject();
            ShadowEffect shadow;
            shadow.offsetX = sh.value(QLatin1String("offsetX")).toDouble(2.0);
            shadow.offsetY = sh.value(QLatin1String("offsetY")).toDouble(-2.0);
            shadow.blur = sh.value(QLatin1String("blur")).toDouble(0);
            shadow.color = sh.contains(QLatin1String("color"))
                ? parseColor(sh.value(QLatin1String("color")).toString()) : QColor(Qt::black);
            s.style.shadow = shadow;
        }
        if (fx.contains(QLatin1String("outline"))) {
            const QJsonObject ol = fx.value(QLatin1String("outline")).toObject();
            OutlineEffect outline;
            outline.width = ol.value(QLatin1String("width")).toDouble(1.0);
            outline.color = ol.contains(QLatin1String("color"))
                ? parseColor(ol.value(QLatin1String("color")).toString()) : QColor(Qt::black);
            s.style.outline = outline;
        }
    }

    if (obj.contains(QLatin1String("transparency"))) {
        const QJsonObject tr = obj.value(QLatin1String("transparency")).toObject();
        Transparency t;
        const QString type = tr.value(QLatin1String("type")).toString();
        if (type == QLatin1String("gradient"))  t.type = TransparencyType::Gradient;
        else if (type == QLatin1String("fade")) t.type = TransparencyType::Fade;

        const QJsonValue value = tr.value(QLatin1String("value"));
        if (value.isObject()) {
            const QJsonObject range = value.toObject();
            t.start = range.value(QLatin1String("start")).toDouble(t.start);
            t.end = range.value(QLatin1String("end")).toDouble(t.end);
        } else if (value.isDouble()) {
            t.value = value.toDouble();
        }
        s.transparency = t;
    }

    if (obj.contains(QLatin1String("pageSpecific"))) {
        const QJsonObject ps = obj.value(QLatin1String("pageSpecific")).toObject();
        PageSpecific pageSpec;
        const QJsonValue range = ps.value(QLatin1String("pageRange"));
        if (range.isArray()) {
            pageSpec.pageRange = PageRange::Pages;
            for (const QJsonValue &v : range.toArray())
                pageSpec.pages.append(v.toInt());
        } else if (range.toString().trimmed().compare(QLatin1String("pages"),
                                                     Qt::CaseInsensitive) == 0) {
            // Explicit selection; the list or expression lives in "pages"
            pageSpec.pageRange = PageRange::Pages;
            const QJsonValue pages = ps.value(QLatin1String("pages"));
            if (pages.isArray()) {
                for (const QJsonValue &v : pages.toArray())
                    pageSpec.pages.append(v.toInt());
            } else {
                pageSpec.pageExpression = pages.toString().trimmed();
            }
        } else {
            const QString rangeStr = range.toString().trimmed();
            static const QRegularExpression keywordRe(
                QStringLiteral("^(all|first|last|odd|even)?$"));
            if (keywordRe.match(rangeStr).hasMatch()) {
                pageSpec.pageRange = pageRangeFromString(rangeStr);
            } else {
                pageSpec.pageRange = PageRange::Pages;
                pageSpec.pageExpression = rangeStr;
            }
        }

        if (ps.contains(QLatin1String("conditional"))) {
            const QJsonObject c = ps.value(QLatin1String("conditional")).toObject();
            Conditional cond;
            if (c.value(QLatin1String("hasImages")).isBool())
                cond.hasImages = c.value(QLatin1String("hasImages")).toBool();
            if (c.value(QLatin1String("hasTables")).isBool())
                cond.hasTables = c.value(QLatin1String("hasTables")).toBool();
            if (c.value(QLatin1String("contentLength")).isString())
                cond.contentLength = contentLengthFromString(
                    c.value(QLatin1String("contentLength")).toString());
            pageSpec.conditional = cond;
        }
        pageSpec.customText = ps.value(QLatin1String("customText")).toString();
        s.pageSpecific = pageSpec;
    }

    s.templ = templateFromString(obj.value(QLatin1String("template")).toString());
    s.organization = obj.value(QLatin1String("organization")).toString(s.organization);
    return s;
}

QJsonObject Settings::toJson() const
{
    QJsonObject obj;
    obj[QLatin1String("text")] = text;
    obj[QLatin1String("opacity")] = opacity;
    if (customFontSize > 0) {
        obj[QLatin1String("fontSize")] = customFontSize;
    } else {
        obj[QLatin1String("fontSize")] = fontSize == FontSize::Small ? QStringLiteral("small")
            : fontSize == FontSize::Large ? QStringLiteral("large")
            : QStringLiteral("medium");
    }
    obj[QLatin1String("color")] = color.name();

    QJsonObject p;
    p[QLatin1String("type")] = positionTypeToString(position.type);
    p[QLatin1String("corner")] = cornerToString(position.corner);
    p[QLatin1String("offset")] = pointToJson(position.offset);
    if (!position.coordinates.isEmpty()) {
        QJsonArray coords;
        for (const QPointF &pt : position.coordinates)
            coords.append(pointToJson(pt));
        p[QLatin1String("coordinates")] = coords;
    }
    obj[QLatin1String("position")] = p;

    QJsonObject st;
    st[QLatin1String("fontFamily")] = fontFamilyToString(style.fontFamily);
    if (style.rotationDeg)
        st[QLatin1String("rotationDeg")] = *style.rotationDeg;
    QJsonObject fx;
    if (style.shadow) {
        QJsonObject sh;
        sh[QLatin1String("offsetX")] = style.shadow->offsetX;
        sh[QLatin1String("offsetY")] = style.shadow->offsetY;
        sh[QLatin1String("blur")] = style.shadow->blur;
        sh[QLatin1String("color")] = style.shadow->color.name();
        fx[QLatin1String("shadow")] = sh;
    }
    if (style.outline) {
        QJsonObject ol;
        ol[QLatin1String("width")] = style.outline->width;
        ol[QLatin1String("color")] = style.outline->color.name();
        fx[QLatin1String("outline")] = ol;
    }
    if (!fx.isEmpty())
        st[QLatin1String("effects")] = fx;
    obj[QLatin1String("style")] = st;

    if (transparency) {
        QJsonObject tr;
        switch (transparency->type) {
        case TransparencyType::Uniform:  tr[QLatin1String("type")] = QStringLiteral("uniform"); break;
        case TransparencyType::Gradient: tr[QLatin1String("type")] = QStringLiteral("gradient"); break;
        case TransparencyType::Fade:     tr[QLatin1String("type")] = QStringLiteral("fade"); break;
        }
        if (transparency->type == TransparencyType::Gradient) {
            QJsonObject range;
            range[QLatin1String("start")] = transparency->start;
            range[QLatin1String("end")] = transparency->end;
            tr[QLatin1String("value")] = range;
        } else if (transparency->value) {
            tr[QLatin1String("value")] = *transparency->value;
        }
        obj[QLatin1String("transparency")] = tr;
    }

    if (pageSpecific) {
        QJsonObject ps;
        if (pageSpecific->pageRange == PageRange::Pages) {
            if (!pageSpecific->pageExpression.isEmpty()) {
                ps[QLatin1String("pageRange")] = pageSpecific->pageExpression;
            } else {
                QJsonArray pages;
                for (int n : pageSpecific->pages)
                    pages.append(n);
                ps[QLatin1String("pageRange")] = pages;
            }
        } else {
            ps[QLatin1String("pageRange")] = pageRangeToString(pageSpecific->pageRange);
        }
        if (pageSpecific->conditional) {
            QJsonObject c;
            if (pageSpecific->conditional->hasImages)
                c[QLatin1String("hasImages")] = *pageSpecific->conditional->hasImages;
            if (pageSpecific->conditional->hasTables)
                c[QLatin1String("hasTables")] = *pageSpecific->conditional->hasTables;
            if (pageSpecific->conditional->contentLength)
                c[QLatin1String("contentLength")] =
                    contentLengthToString(*pageSpecific->conditional->contentLength);
            ps[QLatin1String("conditional")] = c;
        }
        if (!pageSpecific->customText.isEmpty())
            ps[QLatin1String("customText")] = pageSpecific->customText;
        obj[QLatin1String("pageSpecific")] = ps;
    }

    if (templ != Template::None)
        obj[QLatin1String("template")] = templateToString(templ);
    obj[QLatin1String("organization")] = organization;
    return obj;
}

} // namespace Watermark
