/*
 * resourcecache.cpp - Per-document cache of decoded resources
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "resourcecache.h"

#include <QCryptographicHash>
#include <QDebug>

QByteArray ResourceCache::keyFor(const QByteArray &payload)
{
    return QCryptographicHash::hash(payload, QCryptographicHash::Sha1);
}

QImage ResourceCache::image(const QByteArray &payload, const QString &mimeType)
{
    if (payload.isEmpty())
        return QImage();

    const QByteArray key = keyFor(payload);
    auto it = m_images.constFind(key);
    if (it != m_images.constEnd()) {
        ++m_hits;
        return it.value();
    }
    if (m_failed.contains(key)) {
        ++m_hits;
        return QImage();
    }

    ++m_misses;
    QImage img = QImage::fromData(payload);
    if (img.isNull()) {
        qWarning() << "ResourceCache: cannot decode" << payload.size() << "byte"
                   << (mimeType.isEmpty() ? QStringLiteral("image") : mimeType);
        m_failed.insert(key);
        return QImage();
    }
    m_images.insert(key, img);
    return img;
}
