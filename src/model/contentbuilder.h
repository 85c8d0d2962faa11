/*
 * contentbuilder.h - Markup -> Content::ElementList builder
 *
 * Parses extracted HTML markup into a QTextDocument and walks its
 * frame/block tree in document order, emitting one flat element per
 * heading, paragraph, list item, table, image or rule.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGESTAMP_CONTENTBUILDER_H
#define PAGESTAMP_CONTENTBUILDER_H

#include <QString>
#include <QStringList>

#include "contentmodel.h"

class QTextBlock;
class QTextFrame;
class QTextTable;
class QTextTableCell;

class ContentBuilder {
public:
    struct Result {
        Content::ElementList elements;
        bool valid = true;
        bool usedPlainText = false;     // structured walk found nothing
        QString errorMessage;           // non-empty if invalid
    };

    // Markup shorter than this (after trimming) is treated as a failed
    // extraction.
    static constexpr int kMinimumMarkupLength = 20;

    ContentBuilder() = default;

    Result build(const QString &markup);

    // Split plain text into paragraphs on blank lines.
    static Content::ElementList fromPlainText(const QString &text);

private:
    void walkFrame(QTextFrame *frame);
    void addBlock(const QTextBlock &block);
    void addTable(QTextTable *table);
    void addImage(const QString &source, qreal width, qreal height,
                  const QString &title, int position, Qt::Alignment alignment);
    void addText(Content::ElementKind kind, const QString &text,
                 const QTextBlock &block, int position);

    static QString cellText(const QTextTableCell &cell);
    static void collectFrameText(QTextFrame *frame, QStringList &out);

    Content::ElementList m_elements;
};

#endif // PAGESTAMP_CONTENTBUILDER_H
