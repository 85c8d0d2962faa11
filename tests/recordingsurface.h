/*
 * recordingsurface.h - Render::Surface that records draw calls
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGESTAMP_RECORDINGSURFACE_H
#define PAGESTAMP_RECORDINGSURFACE_H

#include <QImage>
#include <QList>

#include "rendersurface.h"

class RecordingSurface : public Render::Surface {
public:
    struct TextCall {
        QString text;
        QPointF origin;
        Render::TextStyle style;
    };

    struct Page {
        QSizeF size;
        QList<TextCall> texts;
        int rects = 0;
        int lines = 0;
        int images = 0;
    };

    QList<Page> pages;
    bool inPage = false;
    int callsOutsidePage = 0;
    bool imagesDecodable = true;

    void beginPage(const QSizeF &size) override
    {
        pages.append(Page{size, {}, 0, 0, 0});
        inPage = true;
    }
    void endPage() override { inPage = false; }

    void drawText(const QString &text, const QPointF &origin,
                  const Render::TextStyle &style) override
    {
        if (!inPage) {
            ++callsOutsidePage;
            return;
        }
        pages.last().texts.append(TextCall{text, origin, style});
    }
    void drawRect(const QRectF &, const QColor &, const QColor &, qreal) override
    {
        if (inPage)
            ++pages.last().rects;
        else
            ++callsOutsidePage;
    }
    void drawLine(const QPointF &, const QPointF &, const QColor &, qreal) override
    {
        if (inPage)
            ++pages.last().lines;
        else
            ++callsOutsidePage;
    }
    bool drawImage(const QByteArray &payload, const QString &, const QRectF &) override
    {
        if (!inPage || !imagesDecodable || QImage::fromData(payload).isNull())
            return false;
        ++pages.last().images;
        return true;
    }

    QByteArray finish() override
    {
        return pages.isEmpty() ? QByteArray() : QByteArray("recorded");
    }
    int pageCount() const override { return pages.size(); }

    // Text calls on a page whose text equals `text`
    QList<TextCall> textsMatching(int page, const QString &text) const
    {
        QList<TextCall> out;
        for (const TextCall &call : pages[page].texts) {
            if (call.text == text)
                out.append(call);
        }
        return out;
    }
};

#endif // PAGESTAMP_RECORDINGSURFACE_H
