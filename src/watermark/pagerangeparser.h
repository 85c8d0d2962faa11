/*
 * pagerangeparser.h - Page selection expressions for watermark gating
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGESTAMP_PAGERANGEPARSER_H
#define PAGESTAMP_PAGERANGEPARSER_H

#include <QSet>
#include <QString>

namespace PageRangeParser {

struct Result {
    QSet<int> pages;        // 1-based page numbers within the document
    bool valid = true;
    QString errorMessage;   // non-empty if invalid
};

// Parse an expression like "1-5, 8, first, odd, (last-1)-last".
// totalPages resolves "last"; "last-N" never resolves below page 1.
// Page numbers beyond the document, and ranges that only run backwards
// because "last" is smaller than their start, select nothing.
Result parse(const QString &expr, int totalPages);

} // namespace PageRangeParser

#endif // PAGESTAMP_PAGERANGEPARSER_H
