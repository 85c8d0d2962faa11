/*
 * contentrenderer.h - Draw content elements on a Render::Surface
 *
 * Positions are given as distances below the top of the content area;
 * the renderer converts them to bottom-up surface coordinates. Line
 * breaking and table metrics come from the layout estimator so what is
 * drawn matches what was paginated.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGESTAMP_CONTENTRENDERER_H
#define PAGESTAMP_CONTENTRENDERER_H

#include "contentmodel.h"
#include "layoutestimator.h"
#include "rendersurface.h"

namespace Render {

class ContentRenderer {
public:
    ContentRenderer(Surface &surface, const Layout::PageConfig &config);

    // Draw one slice of an element with its top edge at `top`; returns
    // the height it occupies.
    qreal draw(const Content::Element &el, const Layout::Slice &slice, qreal top);

    // Images that could not be embedded and were replaced by a text line
    int placeholderCount() const { return m_placeholders; }

private:
    void drawTextElement(const Content::Element &el, const Layout::Slice &slice, qreal top);
    void drawTable(const Content::TableData &table, const Layout::Slice &slice, qreal top);
    qreal drawTableRow(const Content::TableData &table, int row, qreal top);
    void drawImage(const Content::Element &el, qreal top);

    qreal surfaceY(qreal top) const;
    qreal alignedX(const QString &line, qreal fontSize, Qt::Alignment alignment,
                   qreal left, qreal width) const;

    Surface &m_surface;
    Layout::PageConfig m_config;
    int m_placeholders = 0;
};

} // namespace Render

#endif // PAGESTAMP_CONTENTRENDERER_H
