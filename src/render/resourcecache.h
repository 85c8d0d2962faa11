/*
 * resourcecache.h - Per-document cache of decoded resources
 *
 * One instance is created for each processing call and handed to the
 * surface that renders it, so nothing decoded for one document is ever
 * visible to another. Failed decodes are remembered as well.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGESTAMP_RESOURCECACHE_H
#define PAGESTAMP_RESOURCECACHE_H

#include <QByteArray>
#include <QHash>
#include <QImage>
#include <QSet>
#include <QString>

class ResourceCache {
public:
    ResourceCache() = default;
    ResourceCache(const ResourceCache &) = delete;
    ResourceCache &operator=(const ResourceCache &) = delete;

    static QByteArray keyFor(const QByteArray &payload);

    // Null image when the payload is not a decodable image.
    QImage image(const QByteArray &payload, const QString &mimeType);

    int hits() const { return m_hits; }
    int misses() const { return m_misses; }
    int imageCount() const { return m_images.size(); }

private:
    QHash<QByteArray, QImage> m_images;
    QSet<QByteArray> m_failed;
    int m_hits = 0;
    int m_misses = 0;
};

#endif // PAGESTAMP_RESOURCECACHE_H
