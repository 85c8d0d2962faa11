/*
 * pagerangeparser.cpp - Page selection expressions for watermark gating
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagerangeparser.h"

#include <QObject>
#include <QRegularExpression>
#include <QStringList>

namespace PageRangeParser {

// Resolve a single token: a number, "first", "last", "last-N" or "(last-N)"
static int resolveToken(const QString &token, int totalPages, bool &ok)
{
    ok = true;
    const QString t = token.trimmed().toLower();
    if (t == QLatin1String("first")) return 1;
    if (t == QLatin1String("last")) return totalPages;

    static const QRegularExpression lastMinusRe(
        QStringLiteral(R"(^\(?\s*last\s*-\s*(\d+)\s*\)?$)"));
    const auto m = lastMinusRe.match(t);
    if (m.hasMatch())
        return qMax(1, totalPages - m.captured(1).toInt());

    const int page = t.toInt(&ok);
    if (!ok || page < 1) {
        ok = false;
        return -1;
    }
    return page;
}

static bool isLiteralNumber(const QString &token)
{
    bool ok = false;
    token.trimmed().toInt(&ok);
    return ok;
}

static void insertClamped(QSet<int> &pages, int start, int end, int totalPages)
{
    for (int i = qMax(1, start); i <= qMin(end, totalPages); ++i)
        pages.insert(i);
}

Result parse(const QString &expr, int totalPages)
{
    Result result;
    const QString trimmed = expr.trimmed();
    if (trimmed.isEmpty() || trimmed.compare(QLatin1String("all"), Qt::CaseInsensitive) == 0) {
        insertClamped(result.pages, 1, totalPages, totalPages);
        return result;
    }

    const QStringList parts = trimmed.split(QLatin1Char(','));
    for (const QString &part : parts) {
        const QString p = part.trimmed();
        if (p.isEmpty()) continue;

        const QString lower = p.toLower();
        if (lower == QLatin1String("odd") || lower == QLatin1String("even")) {
            const int parity = (lower == QLatin1String("odd")) ? 1 : 0;
            for (int i = 1; i <= totalPages; ++i) {
                if (i % 2 == parity)
                    result.pages.insert(i);
            }
            continue;
        }

        // "last-2" on its own is a single page, not a range
        bool singleOk;
        const int single = resolveToken(p, totalPages, singleOk);
        if (singleOk) {
            insertClamped(result.pages, single, single, totalPages);
            continue;
        }

        // Range: the first top-level '-' whose both sides resolve
        bool matched = false;
        int parenDepth = 0;
        for (int i = 0; i < p.size() && !matched; ++i) {
            if (p[i] == QLatin1Char('(')) { parenDepth++; continue; }
            if (p[i] == QLatin1Char(')')) { parenDepth--; continue; }
            if (p[i] != QLatin1Char('-') || parenDepth != 0)
                continue;

            bool leftOk, rightOk;
            const int start = resolveToken(p.left(i), totalPages, leftOk);
            const int end = resolveToken(p.mid(i + 1), totalPages, rightOk);
            if (!leftOk || !rightOk)
                continue;
            matched = true;
            if (start > end) {
                // "10-last" on a shorter document selects nothing; "5-2" is an error
                if (isLiteralNumber(p.left(i)) && isLiteralNumber(p.mid(i + 1))) {
                    result.valid = false;
                    result.errorMessage = QObject::tr("Invalid range: %1").arg(p);
                    return result;
                }
                continue;
            }
            insertClamped(result.pages, start, end, totalPages);
        }

        if (!matched) {
            result.valid = false;
            result.errorMessage = QObject::tr("Invalid page: %1").arg(p);
            return result;
        }
    }

    return result;
}

} // namespace PageRangeParser
