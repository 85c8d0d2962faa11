/*
 * contentbuilder.cpp - Markup -> Content::ElementList builder
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "contentbuilder.h"

#include <algorithm>

#include <QBuffer>
#include <QDebug>
#include <QFont>
#include <QImageReader>
#include <QRegularExpression>
#include <QTextBlock>
#include <QTextDocument>
#include <QTextFrame>
#include <QTextList>
#include <QTextTable>

namespace {

const QChar kObjectReplacement(0xFFFC);

QString normalizeWhitespace(QString text)
{
    text.remove(kObjectReplacement);
    text.replace(QChar::Nbsp, QLatin1Char(' '));
    return text.simplified();
}

bool isOrderedList(const QTextList *list)
{
    switch (list->format().style()) {
    case QTextListFormat::ListDisc:
    case QTextListFormat::ListCircle:
    case QTextListFormat::ListSquare:
    case QTextListFormat::ListStyleUndefined:
        return false;
    default:
        return true;
    }
}

// True when every non-blank fragment of the block carries the attribute.
bool blockIsUniform(const QTextBlock &block, bool (*test)(const QTextCharFormat &))
{
    bool seen = false;
    for (auto it = block.begin(); !it.atEnd(); ++it) {
        const QTextFragment frag = it.fragment();
        if (!frag.isValid() || frag.text().trimmed().isEmpty())
            continue;
        if (!test(frag.charFormat()))
            return false;
        seen = true;
    }
    return seen;
}

bool isBold(const QTextCharFormat &cf) { return cf.fontWeight() >= QFont::Bold; }
bool isItalic(const QTextCharFormat &cf) { return cf.fontItalic(); }

} // namespace

// --- Entry point ---

ContentBuilder::Result ContentBuilder::build(const QString &markup)
{
    Result result;
    m_elements.clear();

    const QString trimmed = markup.trimmed();
    if (trimmed.size() < kMinimumMarkupLength) {
        result.valid = false;
        result.errorMessage = QStringLiteral(
            "Extracted content is too short (%1 characters); the source is "
            "probably empty or corrupt").arg(trimmed.size());
        qWarning() << "ContentBuilder:" << result.errorMessage;
        return result;
    }

    if (!Qt::mightBeRichText(trimmed)) {
        result.elements = fromPlainText(trimmed);
        result.usedPlainText = true;
    } else {
        QTextDocument doc;
        doc.setHtml(markup);
        walkFrame(doc.rootFrame());

        std::stable_sort(m_elements.begin(), m_elements.end(),
                         [](const Content::Element &a, const Content::Element &b) {
                             return a.sourceOffset < b.sourceOffset;
                         });
        result.elements = std::move(m_elements);
        m_elements.clear();

        if (result.elements.isEmpty()) {
            qDebug() << "ContentBuilder: no structured elements, splitting plain text";
            result.elements = fromPlainText(doc.toPlainText());
            result.usedPlainText = true;
        }
    }

    if (result.elements.isEmpty()) {
        result.valid = false;
        result.errorMessage = QStringLiteral("No text content could be extracted");
        qWarning() << "ContentBuilder:" << result.errorMessage;
        return result;
    }

    qDebug() << "ContentBuilder: built" << result.elements.size() << "elements"
             << (result.usedPlainText ? "(plain text)" : "");
    return result;
}

Content::ElementList ContentBuilder::fromPlainText(const QString &text)
{
    Content::ElementList elements;
    static const QRegularExpression blankLineRe(QStringLiteral(R"(\n\s*\n)"));

    QString normalized = text;
    normalized.replace(QChar::ParagraphSeparator, QLatin1Char('\n'));
    normalized.replace(QLatin1String("\r\n"), QLatin1String("\n"));

    int offset = 0;
    const QStringList chunks = normalized.split(blankLineRe);
    for (const QString &chunk : chunks) {
        const QString para = normalizeWhitespace(chunk);
        if (!para.isEmpty()) {
            Content::Element el;
            el.kind = Content::ElementKind::Paragraph;
            el.text = para;
            el.sourceOffset = offset;
            elements.append(el);
        }
        offset += chunk.size() + 1;
    }
    return elements;
}

// --- Tree walk ---

void ContentBuilder::walkFrame(QTextFrame *frame)
{
    for (auto it = frame->begin(); !it.atEnd(); ++it) {
        if (QTextFrame *child = it.currentFrame()) {
            if (auto *table = qobject_cast<QTextTable *>(child))
                addTable(table);
            else
                walkFrame(child);
        } else {
            const QTextBlock block = it.currentBlock();
            if (block.isValid())
                addBlock(block);
        }
    }
}

void ContentBuilder::addBlock(const QTextBlock &block)
{
    const QTextBlockFormat fmt = block.blockFormat();

    if (fmt.hasProperty(QTextFormat::BlockTrailingHorizontalRulerWidth)) {
        Content::Element rule;
        rule.kind = Content::ElementKind::Spacer;
        rule.estimatedHeight = 12.0;
        rule.sourceOffset = block.position();
        m_elements.append(rule);
        return;
    }

    Content::ElementKind kind = Content::ElementKind::Paragraph;
    if (block.textList())
        kind = Content::ElementKind::List;
    else if (fmt.headingLevel() > 0)
        kind = Content::ElementKind::Heading;

    // Images split the block: text before an image becomes its own
    // element so document order is kept.
    QString pending;
    int pendingPos = -1;
    for (auto it = block.begin(); !it.atEnd(); ++it) {
        const QTextFragment frag = it.fragment();
        if (!frag.isValid())
            continue;
        const QTextCharFormat cf = frag.charFormat();
        if (cf.isImageFormat()) {
            if (pendingPos >= 0) {
                addText(kind, pending, block, pendingPos);
                pending.clear();
                pendingPos = -1;
            }
            const QTextImageFormat img = cf.toImageFormat();
            addImage(img.name(), img.width(), img.height(), img.toolTip(),
                     frag.position(), fmt.alignment());
            continue;
        }
        if (pendingPos < 0)
            pendingPos = frag.position();
        pending += frag.text();
    }
    if (pendingPos >= 0)
        addText(kind, pending, block, pendingPos);
}

void ContentBuilder::addText(Content::ElementKind kind, const QString &raw,
                             const QTextBlock &block, int position)
{
    const QString text = normalizeWhitespace(raw);
    if (text.isEmpty())
        return;

    Content::Element el;
    el.kind = kind;
    el.text = text;
    el.sourceOffset = position;

    const QTextBlockFormat fmt = block.blockFormat();
    el.styleHints.alignment = fmt.alignment() & Qt::AlignHorizontal_Mask;

    el.styleHints.bold = blockIsUniform(block, isBold);
    el.styleHints.italic = blockIsUniform(block, isItalic);

    if (kind == Content::ElementKind::Heading) {
        el.level = qBound(1, fmt.headingLevel(), 6);
    } else if (kind == Content::ElementKind::List) {
        const QTextList *list = block.textList();
        el.level = qMax(1, list->format().indent());
        if (isOrderedList(list)) {
            el.listMarker = list->itemText(block).trimmed();
            if (el.listMarker.isEmpty())
                el.listMarker = QString::number(list->itemNumber(block) + 1) + QLatin1Char('.');
        } else {
            el.listMarker = QString(QChar(0x2022));
        }
    }

    m_elements.append(el);
}

void ContentBuilder::addImage(const QString &source, qreal width, qreal height,
                              const QString &title, int position,
                              Qt::Alignment alignment)
{
    static const QRegularExpression dataUrlRe(
        QStringLiteral(R"(^data:([\w/+.-]+);base64,(.*)$)"),
        QRegularExpression::DotMatchesEverythingOption);

    Content::ImageData img;
    img.altText = title.isEmpty() ? QStringLiteral("image") : title;
    if (alignment & Qt::AlignRight)
        img.alignment = Qt::AlignRight;

    const auto m = dataUrlRe.match(source.trimmed());
    if (m.hasMatch()) {
        img.mimeType = m.captured(1).toLower();
        img.payload = QByteArray::fromBase64(m.captured(2).remove(QLatin1Char(' ')).toLatin1());
    } else {
        qWarning() << "ContentBuilder: image source is not inline data, keeping placeholder"
                   << source.left(64);
    }

    if (width > 0 && height > 0) {
        img.originalWidth = width;
        img.originalHeight = height;
    } else if (!img.payload.isEmpty()) {
        // Header read only; the pixels are decoded by the surface
        QBuffer buffer(&img.payload);
        buffer.open(QIODevice::ReadOnly);
        QImageReader reader(&buffer);
        const QSize size = reader.size();
        if (size.isValid() && !size.isEmpty()) {
            img.originalWidth = size.width();
            img.originalHeight = size.height();
        }
    }

    Content::Element el;
    el.kind = Content::ElementKind::Image;
    el.text = img.altText;
    el.sourceOffset = position;
    el.styleHints.alignment = img.alignment;
    el.image = img;
    m_elements.append(el);
}

// --- Tables ---

void ContentBuilder::addTable(QTextTable *table)
{
    Content::TableData data;
    const int declaredHeaders = table->format().headerRowCount();

    for (int r = 0; r < table->rows(); ++r) {
        Content::TableRow row;
        bool allBold = true;
        for (int c = 0; c < table->columns();) {
            const QTextTableCell cell = table->cellAt(r, c);
            if (!cell.isValid()) {
                ++c;
                continue;
            }
            c += qMax(1, cell.columnSpan());
            // Row-spanned cells are reported again on following rows
            if (cell.row() != r)
                continue;

            Content::TableCell out;
            out.text = cellText(cell);
            const QTextBlock first = table->document()->findBlock(cell.firstPosition());
            if (first.isValid()) {
                out.alignment = first.blockFormat().alignment() & Qt::AlignHorizontal_Mask;
                if (!blockIsUniform(first, isBold))
                    allBold = false;
            }
            row.cells.append(out);
        }
        if (row.cells.isEmpty())
            continue;

        row.isHeader = r < declaredHeaders || allBold;
        for (auto &cell : row.cells) {
            cell.isHeader = row.isHeader;
            if (cell.isHeader)
                cell.alignment = Qt::AlignHCenter;
        }
        data.rows.append(row);
    }

    if (data.rows.isEmpty()) {
        qWarning() << "ContentBuilder: dropping table without rows at" << table->firstPosition();
        return;
    }

    QStringList texts;
    for (const auto &row : data.rows)
        for (const auto &cell : row.cells)
            if (!cell.text.isEmpty())
                texts.append(cell.text);

    Content::Element el;
    el.kind = Content::ElementKind::Table;
    el.text = texts.join(QLatin1Char(' '));
    el.sourceOffset = table->firstPosition();
    el.table = data;
    m_elements.append(el);
}

// Nested tables and lists inside a cell are flattened to plain text.
QString ContentBuilder::cellText(const QTextTableCell &cell)
{
    QStringList parts;
    for (auto it = cell.begin(); !it.atEnd(); ++it) {
        if (QTextFrame *child = it.currentFrame())
            collectFrameText(child, parts);
        else if (it.currentBlock().isValid())
            parts.append(it.currentBlock().text());
    }
    return normalizeWhitespace(parts.join(QLatin1Char(' ')));
}

void ContentBuilder::collectFrameText(QTextFrame *frame, QStringList &out)
{
    for (auto it = frame->begin(); !it.atEnd(); ++it) {
        if (QTextFrame *child = it.currentFrame())
            collectFrameText(child, out);
        else if (it.currentBlock().isValid())
            out.append(it.currentBlock().text());
    }
}
