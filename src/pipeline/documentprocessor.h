/*
 * documentprocessor.h - Markup -> watermarked PDF pipeline
 *
 * Runs content building, layout estimation, pagination and the
 * watermark pass for one document. Every call owns its own resource
 * cache and PDF surface. Whatever goes wrong, the caller gets a PDF:
 * either the document itself or a one-page processing notice that
 * still carries the watermark.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGESTAMP_DOCUMENTPROCESSOR_H
#define PAGESTAMP_DOCUMENTPROCESSOR_H

#include <QByteArray>
#include <QList>
#include <QSizeF>
#include <QString>

#include <functional>

#include "pagesetup.h"
#include "watermarksettings.h"

namespace Render { class Surface; }
namespace Watermark { class Compositor; }

struct ProcessingProgress {
    QString stage;
    int percent = 0;
};

struct ProcessingResult {
    QByteArray pdf;
    int pageCount = 0;
    bool usedFallback = false;
    QList<int> breakIndices;
    int imagePlaceholders = 0;
    QString errorMessage;       // why the fallback was used, or why nothing was produced

    bool ok() const { return !pdf.isEmpty(); }
};

class DocumentProcessor {
public:
    using ProgressCallback = std::function<void(const ProcessingProgress &)>;

    DocumentProcessor() = default;

    void setPageSetup(const PageSetup &setup) { m_pageSetup = setup; }
    const PageSetup &pageSetup() const { return m_pageSetup; }

    void setProgressCallback(ProgressCallback callback) { m_progress = std::move(callback); }

    ProcessingResult process(const QString &markup, const Watermark::Settings &settings);

    // Draws the notice page on an already begun surface.
    static void renderFallback(Render::Surface &surface, const Watermark::Compositor &compositor,
                               const QSizeF &pageSize, const QString &reason);

private:
    bool processDocument(const QString &markup, const Watermark::Settings &settings,
                         ProcessingResult &result);
    ProcessingResult processFallback(const Watermark::Settings &settings, const QString &reason);
    void report(const QString &stage, int percent) const;

    PageSetup m_pageSetup;
    ProgressCallback m_progress;
};

#endif // PAGESTAMP_DOCUMENTPROCESSOR_H
