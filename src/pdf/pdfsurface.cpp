/*
 * pdfsurface.cpp - Render::Surface that writes a PDF document
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfsurface.h"
#include "resourcecache.h"

#include <QDateTime>
#include <QDebug>
#include <QImage>
#include <QtMath>

PdfSurface::PdfSurface(ResourceCache *cache)
    : m_cache(cache)
{
}

// --- PDF coordinate helpers ---

QByteArray PdfSurface::pdfCoord(qreal v)
{
    return QByteArray::number(v, 'f', 2);
}

QByteArray PdfSurface::colorOperator(const QColor &color, bool fill)
{
    if (!color.isValid())
        return {};
    const QByteArray op = fill ? " rg\n" : " RG\n";
    return pdfCoord(color.redF()) + " " + pdfCoord(color.greenF()) + " "
         + pdfCoord(color.blueF()) + op;
}

QByteArray PdfSurface::baseFontName(const Render::Font &font)
{
    switch (font.family) {
    case Render::FontFamily::Times:
        if (font.bold && font.italic) return "Times-BoldItalic";
        if (font.bold)                return "Times-Bold";
        if (font.italic)              return "Times-Italic";
        return "Times-Roman";
    case Render::FontFamily::Courier:
        if (font.bold && font.italic) return "Courier-BoldOblique";
        if (font.bold)                return "Courier-Bold";
        if (font.italic)              return "Courier-Oblique";
        return "Courier";
    case Render::FontFamily::Helvetica:
        break;
    }
    if (font.bold && font.italic) return "Helvetica-BoldOblique";
    if (font.bold)                return "Helvetica-Bold";
    if (font.italic)              return "Helvetica-Oblique";
    return "Helvetica";
}

// --- Resources ---

QByteArray PdfSurface::fontResource(const Render::Font &font)
{
    const QByteArray base = baseFontName(font);
    auto it = m_fontNames.constFind(base);
    if (it != m_fontNames.constEnd())
        return it.value();

    const QByteArray name = "F" + QByteArray::number(m_fontNames.size() + 1);
    m_fontNames.insert(base, name);
    m_resources.fonts.insert(name, m_writer.newObject());
    return name;
}

QByteArray PdfSurface::opacityResource(qreal opacity)
{
    const QByteArray key = QByteArray::number(qBound(0.0, opacity, 1.0), 'f', 3);
    auto it = m_opacityNames.constFind(key);
    if (it != m_opacityNames.constEnd())
        return it.value();

    const QByteArray name = "GS" + QByteArray::number(m_opacityNames.size() + 1);
    m_opacityNames.insert(key, name);
    m_resources.extGState.insert(name, m_writer.newObject());
    return name;
}

// --- Document ---

bool PdfSurface::begin(const QString &title)
{
    if (!m_writer.openBuffer(&m_output)) {
        qWarning() << "PdfSurface: cannot open output buffer";
        return false;
    }
    m_title = title;
    m_writer.writeHeader();
    m_resourcesObj = m_writer.newObject();
    m_open = true;
    return true;
}

bool PdfSurface::checkInPage(const char *op) const
{
    if (m_inPage)
        return true;
    qWarning() << "PdfSurface:" << op << "outside of a page ignored";
    return false;
}

void PdfSurface::beginPage(const QSizeF &size)
{
    if (!m_open) {
        qWarning() << "PdfSurface: beginPage before begin()";
        return;
    }
    if (m_inPage)
        endPage();
    m_pageSize = size;
    m_stream.clear();
    m_inPage = true;
}

void PdfSurface::endPage()
{
    if (!m_inPage)
        return;
    m_inPage = false;

    Pdf::ObjId contentObj = m_writer.startObj();
    m_writer.write("<<\n");
    m_writer.endObjectWithStream(contentObj, m_stream);

    Pdf::ObjId pageObj = m_writer.startObj();
    m_writer.write("<<\n/Type /Page\n/Parent " + Pdf::toObjRef(m_writer.pagesObj()) + "\n");
    m_writer.write("/MediaBox [0 0 " + pdfCoord(m_pageSize.width()) + " "
                   + pdfCoord(m_pageSize.height()) + "]\n");
    m_writer.write("/Resources " + Pdf::toObjRef(m_resourcesObj) + "\n");
    m_writer.write("/Contents " + Pdf::toObjRef(contentObj) + "\n>>");
    m_writer.endObj(pageObj);

    m_pageObjIds.append(pageObj);
    m_stream.clear();
}

QByteArray PdfSurface::finish()
{
    if (!m_open) {
        qWarning() << "PdfSurface: finish without begin()";
        return {};
    }
    endPage();
    m_open = false;

    if (m_pageObjIds.isEmpty()) {
        qWarning() << "PdfSurface: document has no pages";
        m_writer.close(true);
        return {};
    }

    for (auto it = m_fontNames.constBegin(); it != m_fontNames.constEnd(); ++it) {
        const Pdf::ObjId id = m_resources.fonts.value(it.value());
        m_writer.startObj(id);
        m_writer.write("<< /Type /Font /Subtype /Type1 /BaseFont " + Pdf::toName(it.key())
                       + " /Encoding /WinAnsiEncoding >>");
        m_writer.endObj(id);
    }
    for (auto it = m_opacityNames.constBegin(); it != m_opacityNames.constEnd(); ++it) {
        const Pdf::ObjId id = m_resources.extGState.value(it.value());
        m_writer.startObj(id);
        m_writer.write("<< /Type /ExtGState /ca " + it.key() + " /CA " + it.key() + " >>");
        m_writer.endObj(id);
    }

    m_writer.startObj(m_resourcesObj);
    m_writer.writeResourceDict(m_resources);
    m_writer.endObj(m_resourcesObj);

    m_writer.startObj(m_writer.pagesObj());
    m_writer.write("<<\n/Type /Pages\n/Kids [");
    for (int i = 0; i < m_pageObjIds.size(); ++i) {
        if (i > 0)
            m_writer.write(" ");
        m_writer.write(Pdf::toObjRef(m_pageObjIds[i]));
    }
    m_writer.write("]\n/Count " + Pdf::toPdf(m_pageObjIds.size()) + "\n>>");
    m_writer.endObj(m_writer.pagesObj());

    m_writer.startObj(m_writer.infoObj());
    m_writer.write("<<\n/Producer " + Pdf::toLiteralString(QByteArray("PageStamp")) + "\n");
    if (!m_title.isEmpty())
        m_writer.write("/Title " + Pdf::toHexString(Pdf::toUTF16(m_title)) + "\n");
    m_writer.write("/CreationDate "
                   + Pdf::toLiteralString(Pdf::toDateString(QDateTime::currentDateTimeUtc()))
                   + "\n>>");
    m_writer.endObj(m_writer.infoObj());

    m_writer.startObj(m_writer.catalogObj());
    m_writer.write("<<\n/Type /Catalog\n/Pages " + Pdf::toObjRef(m_writer.pagesObj()) + "\n>>");
    m_writer.endObj(m_writer.catalogObj());

    m_writer.writeXrefAndTrailer();
    m_writer.close();

    qDebug() << "PdfSurface:" << m_pageObjIds.size() << "pages," << m_output.size() << "bytes";
    return m_output;
}

// --- Drawing ---

void PdfSurface::drawText(const QString &text, const QPointF &origin,
                          const Render::TextStyle &style)
{
    if (!checkInPage("drawText") || text.isEmpty())
        return;

    const QByteArray fontName = fontResource(style.font);
    const qreal rad = qDegreesToRadians(style.rotationDeg);
    const qreal c = qCos(rad);
    const qreal s = qSin(rad);

    m_stream += "q\n";
    if (style.opacity < 1.0)
        m_stream += "/" + opacityResource(style.opacity) + " gs\n";
    m_stream += colorOperator(style.color, true);
    m_stream += "BT\n/" + fontName + " " + pdfCoord(style.font.size) + " Tf\n";
    m_stream += pdfCoord(c) + " " + pdfCoord(s) + " " + pdfCoord(-s) + " " + pdfCoord(c) + " "
              + pdfCoord(origin.x()) + " " + pdfCoord(origin.y()) + " Tm\n";
    m_stream += Pdf::toLiteralString(Pdf::toWinAnsi(text)) + " Tj\nET\nQ\n";
}

void PdfSurface::drawRect(const QRectF &rect, const QColor &fill,
                          const QColor &stroke, qreal strokeWidth)
{
    if (!checkInPage("drawRect"))
        return;
    const bool doFill = fill.isValid();
    const bool doStroke = stroke.isValid() && strokeWidth > 0;
    if (!doFill && !doStroke)
        return;

    m_stream += "q\n";
    if (doFill)
        m_stream += colorOperator(fill, true);
    if (doStroke) {
        m_stream += colorOperator(stroke, false);
        m_stream += pdfCoord(strokeWidth) + " w\n";
    }
    m_stream += pdfCoord(rect.x()) + " " + pdfCoord(rect.y()) + " "
              + pdfCoord(rect.width()) + " " + pdfCoord(rect.height()) + " re ";
    m_stream += (doFill && doStroke) ? "B\n" : (doFill ? "f\n" : "S\n");
    m_stream += "Q\n";
}

void PdfSurface::drawLine(const QPointF &from, const QPointF &to,
                          const QColor &color, qreal width)
{
    if (!checkInPage("drawLine"))
        return;
    m_stream += "q\n" + colorOperator(color, false) + pdfCoord(width) + " w\n";
    m_stream += pdfCoord(from.x()) + " " + pdfCoord(from.y()) + " m "
              + pdfCoord(to.x()) + " " + pdfCoord(to.y()) + " l S\nQ\n";
}

bool PdfSurface::drawImage(const QByteArray &payload, const QString &mimeType,
                           const QRectF &rect)
{
    if (!checkInPage("drawImage") || !m_cache)
        return false;

    const QByteArray key = ResourceCache::keyFor(payload);
    QByteArray imgName = m_imageNames.value(key);
    if (imgName.isEmpty()) {
        const QImage decoded = m_cache->image(payload, mimeType);
        if (decoded.isNull())
            return false;

        // Raw RGB rows; alpha is dropped
        const QImage rgb = decoded.convertToFormat(QImage::Format_RGB888);
        QByteArray rawData;
        rawData.reserve(rgb.width() * rgb.height() * 3);
        for (int y = 0; y < rgb.height(); ++y) {
            const uchar *line = rgb.constScanLine(y);
            rawData.append(reinterpret_cast<const char *>(line), rgb.width() * 3);
        }

        Pdf::ObjId imgObj = m_writer.startObj();
        m_writer.write("<<\n/Type /XObject\n/Subtype /Image\n");
        m_writer.write("/Width " + Pdf::toPdf(rgb.width()) + "\n");
        m_writer.write("/Height " + Pdf::toPdf(rgb.height()) + "\n");
        m_writer.write("/ColorSpace /DeviceRGB\n/BitsPerComponent 8\n");
        m_writer.endObjectWithStream(imgObj, rawData);

        imgName = "Im" + QByteArray::number(m_imageNames.size() + 1);
        m_imageNames.insert(key, imgName);
        m_resources.xObjects.insert(imgName, imgObj);
    }

    // Translate + scale with cm, then paint with Do
    m_stream += "q\n" + pdfCoord(rect.width()) + " 0 0 " + pdfCoord(rect.height()) + " "
              + pdfCoord(rect.x()) + " " + pdfCoord(rect.y()) + " cm\n/" + imgName + " Do\nQ\n";
    return true;
}
