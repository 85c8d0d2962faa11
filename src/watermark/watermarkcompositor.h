/*
 * watermarkcompositor.h - Resolve and draw watermark instances per page
 *
 * For each finished page the compositor decides whether the watermark
 * applies, resolves the text, positions and opacities of its instances
 * and draws them (shadow, outline, then main text) on the surface.
 * It never sees or modifies the content model.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGESTAMP_WATERMARKCOMPOSITOR_H
#define PAGESTAMP_WATERMARKCOMPOSITOR_H

#include <QColor>
#include <QList>
#include <QPointF>
#include <QSizeF>
#include <QString>

#include "rendersurface.h"
#include "watermarksettings.h"

namespace Watermark {

// One resolved rendering of the watermark text on one page.
struct Instance {
    QString text;
    qreal x = 0;                // baseline origin, PDF coordinates
    qreal y = 0;
    qreal rotationDeg = 0;
    qreal opacity = 0;          // 0..1
    Render::Font font;
    QColor color;
    qreal textWidth = 0;        // approximate

    // Midpoint of the baseline, taking rotation into account
    QPointF center() const;
};

// What the compositor is allowed to know about a finished page.
struct PageContext {
    int pageNumber = 1;         // 1-based
    int totalPages = 1;
    QSizeF pageSize{612.0, 792.0};
    bool hasImages = false;
    bool hasTables = false;
    int textLength = 0;         // characters of paragraph and heading text
};

ContentLength classifyContentLength(int characters);

class Compositor {
public:
    explicit Compositor(const Settings &settings);

    const Settings &settings() const { return m_settings; }

    bool appliesTo(const PageContext &page) const;
    QString resolveText(int pageNumber) const;

    // Empty when the page is gated out.
    QList<Instance> resolve(const PageContext &page) const;

    // Draw all instances for the page; returns how many were drawn.
    int composite(Render::Surface &surface, const PageContext &page) const;

    static qreal approxTextWidth(const QString &text, qreal fontSize);

private:
    Instance makeInstance(const QString &text, const QPointF &origin,
                          qreal rotationDeg, const QSizeF &pageSize) const;
    Instance centered(const QString &text, qreal rotationDeg,
                      const QSizeF &pageSize) const;
    Instance atCorner(const QString &text, Corner corner, const QPointF &offset,
                      qreal rotationDeg, const QSizeF &pageSize) const;
    qreal resolveOpacity(const QPointF &at, const QSizeF &pageSize) const;
    void drawInstance(Render::Surface &surface, const Instance &inst) const;

    Settings m_settings;
};

} // namespace Watermark

#endif // PAGESTAMP_WATERMARKCOMPOSITOR_H
