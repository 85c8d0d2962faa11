/*
 * pagesetup.h - Base page geometry for generated documents
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGESTAMP_PAGESETUP_H
#define PAGESTAMP_PAGESETUP_H

#include <QMarginsF>
#include <QPageLayout>
#include <QPageSize>
#include <QSizeF>

class QJsonObject;

struct PageSetup
{
    QPageSize::PageSizeId pageSizeId = QPageSize::Letter;
    QPageLayout::Orientation orientation = QPageLayout::Portrait;
    QMarginsF margins{72.0, 72.0, 72.0, 72.0}; // points

    // Full page size in points (72 dpi)
    QSizeF pageSizePoints() const
    {
        QSizeF full = QPageSize(pageSizeId).size(QPageSize::Point);
        if (orientation == QPageLayout::Landscape)
            full.transpose();
        return full;
    }

    static PageSetup fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;
};

#endif // PAGESTAMP_PAGESETUP_H
