/*
 * pdfsurface.h - Render::Surface that writes a PDF document
 *
 * Text uses the standard 14 Type1 fonts with WinAnsi encoding, so no
 * font program is embedded. Opacity is expressed with /ExtGState
 * dictionaries, images are embedded once per document as
 * Flate-compressed RGB XObjects. All pages share one resource
 * dictionary that is written when the document is finished.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGESTAMP_PDFSURFACE_H
#define PAGESTAMP_PDFSURFACE_H

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QSizeF>
#include <QString>

#include "pdfwriter.h"
#include "rendersurface.h"

class ResourceCache;

class PdfSurface : public Render::Surface {
public:
    explicit PdfSurface(ResourceCache *cache);

    // Must be called once before the first page.
    bool begin(const QString &title);

    void beginPage(const QSizeF &size) override;
    void endPage() override;

    void drawText(const QString &text, const QPointF &origin,
                  const Render::TextStyle &style) override;
    void drawRect(const QRectF &rect, const QColor &fill,
                  const QColor &stroke, qreal strokeWidth = 1.0) override;
    void drawLine(const QPointF &from, const QPointF &to,
                  const QColor &color, qreal width = 1.0) override;
    bool drawImage(const QByteArray &payload, const QString &mimeType,
                   const QRectF &rect) override;

    QByteArray finish() override;

    int pageCount() const override { return m_pageObjIds.size(); }

    static QByteArray baseFontName(const Render::Font &font);

private:
    static QByteArray pdfCoord(qreal v);
    static QByteArray colorOperator(const QColor &color, bool fill);

    QByteArray fontResource(const Render::Font &font);
    QByteArray opacityResource(qreal opacity);
    bool checkInPage(const char *op) const;

    ResourceCache *m_cache = nullptr;
    Pdf::Writer m_writer;
    QByteArray m_output;
    QString m_title;
    bool m_open = false;

    Pdf::ObjId m_resourcesObj = 0;
    Pdf::ResourceDict m_resources;
    QHash<QByteArray, QByteArray> m_fontNames;      // base font -> resource name
    QHash<QByteArray, QByteArray> m_opacityNames;   // "0.300" -> resource name
    QHash<QByteArray, QByteArray> m_imageNames;     // payload key -> resource name

    QList<Pdf::ObjId> m_pageObjIds;
    QByteArray m_stream;
    QSizeF m_pageSize;
    bool m_inPage = false;
};

#endif // PAGESTAMP_PDFSURFACE_H
