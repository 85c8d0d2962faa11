/*
 * watermarkcompositor.cpp - Resolve and draw watermark instances per page
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "watermarkcompositor.h"
#include "pagerangeparser.h"

#include <QDebug>
#include <QtMath>

namespace Watermark {

static constexpr qreal kCenterRotation = -45.0;
static constexpr qreal kShadowOpacityFactor = 0.3;
static constexpr qreal kOutlineOpacityFactor = 0.5;
static constexpr int kShortContentLimit = 500;
static constexpr int kMediumContentLimit = 2000;

QPointF Instance::center() const
{
    const qreal rad = qDegreesToRadians(rotationDeg);
    return QPointF(x + qCos(rad) * textWidth / 2.0,
                   y + qSin(rad) * textWidth / 2.0);
}

ContentLength classifyContentLength(int characters)
{
    if (characters < kShortContentLimit)
        return ContentLength::Short;
    if (characters < kMediumContentLimit)
        return ContentLength::Medium;
    return ContentLength::Long;
}

Compositor::Compositor(const Settings &settings)
    : m_settings(settings)
{
    if (m_settings.pageSpecific && m_settings.pageSpecific->pageRange == PageRange::Pages
        && !m_settings.pageSpecific->pageExpression.isEmpty()) {
        // Syntax check only; "last" is resolved per document
        const auto check = PageRangeParser::parse(m_settings.pageSpecific->pageExpression, 1);
        if (!check.valid)
            qWarning() << "WatermarkCompositor: page range" << m_settings.pageSpecific->pageExpression
                       << "is invalid:" << check.errorMessage << "- no page will match";
    }
}

qreal Compositor::approxTextWidth(const QString &text, qreal fontSize)
{
    return text.size() * fontSize * 0.6;
}

// --- Gate ---

bool Compositor::appliesTo(const PageContext &page) const
{
    if (!m_settings.pageSpecific)
        return true;
    const PageSpecific &ps = *m_settings.pageSpecific;
    const int n = page.pageNumber;

    bool inRange = true;
    switch (ps.pageRange) {
    case PageRange::All:   inRange = true; break;
    case PageRange::First: inRange = (n == 1); break;
    case PageRange::Last:  inRange = (n == page.totalPages); break;
    case PageRange::Odd:   inRange = (n % 2 == 1); break;
    case PageRange::Even:  inRange = (n % 2 == 0); break;
    case PageRange::Pages:
        if (!ps.pageExpression.isEmpty()) {
            const auto parsed = PageRangeParser::parse(ps.pageExpression, page.totalPages);
            inRange = parsed.valid && parsed.pages.contains(n);
        } else {
            inRange = ps.pages.contains(n);
        }
        break;
    }
    if (!inRange)
        return false;

    if (ps.conditional) {
        const Conditional &c = *ps.conditional;
        if (c.hasImages && *c.hasImages != page.hasImages)
            return false;
        if (c.hasTables && *c.hasTables != page.hasTables)
            return false;
        if (c.contentLength && *c.contentLength != classifyContentLength(page.textLength))
            return false;
    }
    return true;
}

// --- Text ---

QString Compositor::resolveText(int pageNumber) const
{
    const QString number = QString::number(pageNumber);
    static const QString placeholder = QStringLiteral("{pageNumber}");

    if (m_settings.pageSpecific && !m_settings.pageSpecific->customText.isEmpty()) {
        QString text = m_settings.pageSpecific->customText;
        return text.replace(placeholder, number);
    }

    const QString base = m_settings.text.isEmpty()
        ? QStringLiteral("CONFIDENTIAL") : m_settings.text;

    switch (m_settings.templ) {
    case Template::Corporate:
        return QStringLiteral("CONFIDENTIAL - %1 - Page %2").arg(m_settings.organization, number);
    case Template::Confidential:
        return QStringLiteral("CONFIDENTIAL DOCUMENT - %1").arg(number);
    case Template::Draft:
        return QStringLiteral("DRAFT COPY - Page %1 - DO NOT DISTRIBUTE").arg(number);
    case Template::Custom:
        return QStringLiteral("%1 - %2").arg(base, number);
    case Template::None:
        break;
    }

    QString text = base;
    return text.replace(placeholder, number);
}

// --- Positions ---

Instance Compositor::makeInstance(const QString &text, const QPointF &origin,
                                  qreal rotationDeg, const QSizeF &pageSize) const
{
    Instance inst;
    inst.text = text;
    inst.x = origin.x();
    inst.y = origin.y();
    inst.rotationDeg = rotationDeg;
    inst.font = m_settings.font();
    inst.color = m_settings.color.isValid() ? m_settings.color : Settings::defaultColor();
    inst.textWidth = approxTextWidth(text, inst.font.size);
    inst.opacity = resolveOpacity(inst.center(), pageSize);
    return inst;
}

Instance Compositor::centered(const QString &text, qreal rotationDeg,
                              const QSizeF &pageSize) const
{
    // Place the baseline midpoint on the page center
    const qreal rad = qDegreesToRadians(rotationDeg);
    const qreal half = approxTextWidth(text, m_settings.pointSize()) / 2.0;
    const QPointF origin(pageSize.width() / 2.0 - qCos(rad) * half,
                         pageSize.height() / 2.0 - qSin(rad) * half);
    return makeInstance(text, origin, rotationDeg, pageSize);
}

Instance Compositor::atCorner(const QString &text, Corner corner, const QPointF &offset,
                              qreal rotationDeg, const QSizeF &pageSize) const
{
    const qreal fontSize = m_settings.pointSize();
    const qreal textWidth = approxTextWidth(text, fontSize);
    const qreal textHeight = fontSize * 1.2;
    const qreal margin = qMin(pageSize.width(), pageSize.height()) * 0.05;

    QPointF origin;
    switch (corner) {
    case Corner::TopLeft:
        origin = QPointF(margin, pageSize.height() - margin - textHeight);
        break;
    case Corner::TopRight:
        origin = QPointF(pageSize.width() - margin - textWidth,
                         pageSize.height() - margin - textHeight);
        break;
    case Corner::BottomLeft:
        origin = QPointF(margin, margin);
        break;
    case Corner::BottomRight:
        origin = QPointF(pageSize.width() - margin - textWidth, margin);
        break;
    }
    return makeInstance(text, origin + offset, rotationDeg, pageSize);
}

QList<Instance> Compositor::resolve(const PageContext &page) const
{
    QList<Instance> instances;
    if (!appliesTo(page))
        return instances;

    const QString text = resolveText(page.pageNumber);
    const QSizeF &size = page.pageSize;
    const Position &pos = m_settings.position;
    const auto &rotation = m_settings.style.rotationDeg;

    switch (pos.type) {
    case PositionType::Center:
        instances.append(centered(text, rotation.value_or(kCenterRotation), size));
        break;
    case PositionType::Corner:
        instances.append(atCorner(text, pos.corner, pos.offset, rotation.value_or(0.0), size));
        break;
    case PositionType::Custom:
        if (pos.coordinates.isEmpty()) {
            qWarning() << "WatermarkCompositor: custom position without coordinates, centering";
            instances.append(centered(text, rotation.value_or(0.0), size));
        }
        for (const QPointF &pt : pos.coordinates)
            instances.append(makeInstance(text, pt, rotation.value_or(0.0), size));
        break;
    case PositionType::Multiple:
        instances.append(centered(text, kCenterRotation, size));
        instances.append(atCorner(text, Corner::TopLeft, QPointF(), 0.0, size));
        instances.append(atCorner(text, Corner::TopRight, QPointF(), 0.0, size));
        instances.append(atCorner(text, Corner::BottomLeft, QPointF(), 0.0, size));
        instances.append(atCorner(text, Corner::BottomRight, QPointF(), 0.0, size));
        break;
    }
    return instances;
}

// --- Opacity ---

qreal Compositor::resolveOpacity(const QPointF &at, const QSizeF &pageSize) const
{
    qreal opacity = m_settings.opacity / 100.0;

    if (m_settings.transparency) {
        const Transparency &t = *m_settings.transparency;
        const qreal value = t.value.value_or(m_settings.opacity);
        switch (t.type) {
        case TransparencyType::Uniform:
            opacity = value / 100.0;
            break;
        case TransparencyType::Gradient: {
            const qreal fraction = pageSize.width() > 0
                ? qBound(0.0, at.x() / pageSize.width(), 1.0) : 0.5;
            const qreal factor = qSin(fraction * M_PI);
            opacity = (t.start + (t.end - t.start) * factor) / 100.0;
            break;
        }
        case TransparencyType::Fade: {
            const QPointF center(pageSize.width() / 2.0, pageSize.height() / 2.0);
            const qreal halfDiagonal = qSqrt(center.x() * center.x() + center.y() * center.y());
            const QPointF d = at - center;
            const qreal distance = qSqrt(d.x() * d.x() + d.y() * d.y());
            const qreal normalized = halfDiagonal > 0 ? qMin(1.0, distance / halfDiagonal) : 0.0;
            opacity = value / 100.0 * (1.0 - normalized);
            break;
        }
        }
    }
    return qBound(0.0, opacity, 1.0);
}

// --- Drawing ---

void Compositor::drawInstance(Render::Surface &surface, const Instance &inst) const
{
    Render::TextStyle style;
    style.font = inst.font;
    style.rotationDeg = inst.rotationDeg;

    if (m_settings.style.shadow) {
        const ShadowEffect &shadow = *m_settings.style.shadow;
        style.color = shadow.color;
        style.opacity = inst.opacity * kShadowOpacityFactor;
        surface.drawText(inst.text, QPointF(inst.x + shadow.offsetX, inst.y + shadow.offsetY), style);
    }

    if (m_settings.style.outline) {
        const OutlineEffect &outline = *m_settings.style.outline;
        const qreal w = outline.width;
        static const int offsets[8][2] = {
            {-1, -1}, {0, -1}, {1, -1},
            {-1,  0},          {1,  0},
            {-1,  1}, {0,  1}, {1,  1},
        };
        style.color = outline.color;
        style.opacity = inst.opacity * kOutlineOpacityFactor;
        for (const auto &o : offsets)
            surface.drawText(inst.text, QPointF(inst.x + o[0] * w, inst.y + o[1] * w), style);
    }

    style.color = inst.color;
    style.opacity = inst.opacity;
    surface.drawText(inst.text, QPointF(inst.x, inst.y), style);
}

int Compositor::composite(Render::Surface &surface, const PageContext &page) const
{
    const QList<Instance> instances = resolve(page);
    for (const Instance &inst : instances)
        drawInstance(surface, inst);

    qDebug() << "WatermarkCompositor: page" << page.pageNumber << "of" << page.totalPages
             << "-" << instances.size() << "instance(s)";
    return instances.size();
}

} // namespace Watermark
