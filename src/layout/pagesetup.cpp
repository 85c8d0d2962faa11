/*
 * pagesetup.cpp - JSON serialization for PageSetup
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagesetup.h"

#include <QDebug>
#include <QJsonObject>

PageSetup PageSetup::fromJson(const QJsonObject &obj)
{
    PageSetup ps;

    if (obj.contains(QLatin1String("pageSize"))) {
        QString sizeStr = obj.value(QLatin1String("pageSize")).toString();
        if (sizeStr == QLatin1String("A4"))          ps.pageSizeId = QPageSize::A4;
        else if (sizeStr == QLatin1String("A5"))     ps.pageSizeId = QPageSize::A5;
        else if (sizeStr == QLatin1String("Legal"))  ps.pageSizeId = QPageSize::Legal;
        else if (sizeStr == QLatin1String("Letter")) ps.pageSizeId = QPageSize::Letter;
        else
            qWarning() << "PageSetup: unknown page size" << sizeStr << "- using Letter";
    }
    if (obj.contains(QLatin1String("orientation"))) {
        QString orient = obj.value(QLatin1String("orientation")).toString();
        ps.orientation = (orient == QLatin1String("landscape"))
            ? QPageLayout::Landscape : QPageLayout::Portrait;
    }
    if (obj.contains(QLatin1String("margins"))) {
        QJsonObject m = obj.value(QLatin1String("margins")).toObject();
        ps.margins = QMarginsF(
            qMax(0.0, m.value(QLatin1String("left")).toDouble(72.0)),
            qMax(0.0, m.value(QLatin1String("top")).toDouble(72.0)),
            qMax(0.0, m.value(QLatin1String("right")).toDouble(72.0)),
            qMax(0.0, m.value(QLatin1String("bottom")).toDouble(72.0)));
    }
    return ps;
}

QJsonObject PageSetup::toJson() const
{
    QJsonObject obj;
    QString sizeStr;
    switch (pageSizeId) {
    case QPageSize::A4:    sizeStr = QStringLiteral("A4"); break;
    case QPageSize::A5:    sizeStr = QStringLiteral("A5"); break;
    case QPageSize::Legal: sizeStr = QStringLiteral("Legal"); break;
    default:               sizeStr = QStringLiteral("Letter"); break;
    }
    obj[QLatin1String("pageSize")] = sizeStr;
    obj[QLatin1String("orientation")] = (orientation == QPageLayout::Landscape)
        ? QStringLiteral("landscape") : QStringLiteral("portrait");

    QJsonObject m;
    m[QLatin1String("left")] = margins.left();
    m[QLatin1String("top")] = margins.top();
    m[QLatin1String("right")] = margins.right();
    m[QLatin1String("bottom")] = margins.bottom();
    obj[QLatin1String("margins")] = m;
    return obj;
}
