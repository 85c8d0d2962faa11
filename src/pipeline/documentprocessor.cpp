/*
 * documentprocessor.cpp - Markup -> watermarked PDF pipeline
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "documentprocessor.h"
#include "contentbuilder.h"
#include "paginator.h"
#include "pdfsurface.h"
#include "resourcecache.h"
#include "watermarkcompositor.h"

#include <QCoreApplication>
#include <QDebug>
#include <QStringList>

#include <exception>

static const QColor kNoticeColor(0x1a, 0x1a, 0x1a);
static const QColor kDetailColor(0x55, 0x55, 0x55);

void DocumentProcessor::report(const QString &stage, int percent) const
{
    if (m_progress)
        m_progress(ProcessingProgress{stage, percent});
}

ProcessingResult DocumentProcessor::process(const QString &markup,
                                            const Watermark::Settings &settings)
{
    ProcessingResult result;
    QString failure;
    try {
        if (processDocument(markup, settings, result))
            return result;
        failure = result.errorMessage;
    } catch (const std::exception &e) {
        failure = QStringLiteral("Internal error: %1").arg(QString::fromLocal8Bit(e.what()));
        qWarning() << "DocumentProcessor:" << failure;
    }

    qWarning() << "DocumentProcessor: producing fallback document:" << failure;
    return processFallback(settings, failure);
}

bool DocumentProcessor::processDocument(const QString &markup,
                                        const Watermark::Settings &settings,
                                        ProcessingResult &result)
{
    ContentBuilder builder;
    ContentBuilder::Result built = builder.build(markup);
    report(QStringLiteral("Extracting content"), 15);
    if (!built.valid) {
        result.errorMessage = built.errorMessage;
        return false;
    }
    if (built.usedPlainText)
        qDebug() << "DocumentProcessor: no structured content, using plain paragraphs";

    Content::ElementList elements = std::move(built.elements);
    Layout::Paginator paginator(m_pageSetup);
    Layout::Plan plan = paginator.prepare(elements);
    report(QStringLiteral("Parsing content"), 35);

    paginator.plan(elements, plan);
    report(QStringLiteral("Planning pages"), 60);

    const Watermark::Compositor compositor(settings);
    ResourceCache cache;
    PdfSurface surface(&cache);
    if (!surface.begin(QString())) {
        result.errorMessage = QStringLiteral("Cannot start PDF output");
        return false;
    }

    auto onDrawn = [this](int drawn, int total) {
        const int percent = total > 0 ? 60 + (30 * drawn) / total : 90;
        report(QStringLiteral("Rendering pages"), qMin(percent, 90));
    };
    paginator.render(elements, plan, surface, compositor, onDrawn);

    report(QStringLiteral("Finalizing"), 90);
    const QByteArray pdf = surface.finish();
    if (pdf.isEmpty()) {
        result.errorMessage = QStringLiteral("PDF generation produced no output");
        return false;
    }

    result.pdf = pdf;
    result.pageCount = surface.pageCount();
    result.breakIndices = plan.breakIndices;
    result.imagePlaceholders = paginator.placeholderCount();
    result.usedFallback = false;
    report(QStringLiteral("Done"), 100);

    qDebug() << "DocumentProcessor:" << elements.size() << "elements," << result.pageCount
             << "pages, image cache" << cache.hits() << "hits" << cache.misses() << "misses";
    return true;
}

ProcessingResult DocumentProcessor::processFallback(const Watermark::Settings &settings,
                                                    const QString &reason)
{
    ProcessingResult result;
    result.usedFallback = true;
    result.errorMessage = reason;

    try {
        const Watermark::Compositor compositor(settings);
        ResourceCache cache;
        PdfSurface surface(&cache);
        if (!surface.begin(QStringLiteral("Document Processing Notice"))) {
            result.errorMessage = QStringLiteral("Cannot start PDF output");
            return result;
        }

        report(QStringLiteral("Finalizing"), 90);
        renderFallback(surface, compositor, m_pageSetup.pageSizePoints(), reason);
        result.pdf = surface.finish();
        result.pageCount = surface.pageCount();
    } catch (const std::exception &e) {
        result.pdf.clear();
        result.pageCount = 0;
        result.errorMessage = QStringLiteral("Fallback generation failed: %1")
                                  .arg(QString::fromLocal8Bit(e.what()));
    }

    if (result.pdf.isEmpty()) {
        qWarning() << "DocumentProcessor: fallback document could not be produced";
        return result;
    }
    report(QStringLiteral("Done"), 100);
    return result;
}

void DocumentProcessor::renderFallback(Render::Surface &surface,
                                       const Watermark::Compositor &compositor,
                                       const QSizeF &pageSize, const QString &reason)
{
    const qreal left = 72.0;
    qreal y = pageSize.height() - 100.0;

    surface.beginPage(pageSize);

    Render::TextStyle title;
    title.font.size = 18;
    title.font.bold = true;
    title.color = kNoticeColor;
    surface.drawText(QCoreApplication::translate("DocumentProcessor", "Document Processing Notice"),
                     QPointF(left, y), title);
    y -= 36;

    Render::TextStyle body;
    body.font.size = 12;
    body.color = kNoticeColor;
    const QStringList lines = {
        QCoreApplication::translate("DocumentProcessor",
                                    "The original document could not be processed completely."),
        QCoreApplication::translate("DocumentProcessor",
                                    "This notice was generated in its place."),
    };
    for (const QString &line : lines) {
        surface.drawText(line, QPointF(left, y), body);
        y -= 18;
    }

    if (!reason.isEmpty()) {
        Render::TextStyle detail;
        detail.font.size = 10;
        detail.color = kDetailColor;
        y -= 10;
        surface.drawText(QCoreApplication::translate("DocumentProcessor", "Reason: %1").arg(reason),
                         QPointF(left, y), detail);
    }

    Watermark::PageContext page;
    page.pageNumber = 1;
    page.totalPages = 1;
    page.pageSize = pageSize;
    compositor.composite(surface, page);
    surface.endPage();
}
