/*
 * pdfwriter.h - Low-level PDF object writer
 *
 * Derived from the Scribus PDF writer (Andreas Vox, 2014), reduced to
 * what a single-pass, in-memory generator needs:
 *   - PDF-1.7 header, sequential object ids, classic xref table
 *   - Flate-compressed streams through zlib
 *   - WinAnsi text for the standard 14 fonts
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGESTAMP_PDFWRITER_H
#define PAGESTAMP_PDFWRITER_H

#include <cstdint>
#include <type_traits>

#include <QByteArray>
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QString>

namespace Pdf {

using ObjId = uint32_t;

// --- Serialization helpers (cf. PDF32000-2008, 7.3) ---

// Windows-1252 as used by /WinAnsiEncoding; unmappable characters
// become '?'.
uchar toWinAnsi(QChar c);
QByteArray toWinAnsi(const QString &s);

QByteArray toUTF16(const QString &s);

QByteArray toPdf(bool v);

template <typename T, std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>, bool> = true>
inline QByteArray toPdf(T v) { return QByteArray::number(static_cast<qlonglong>(v)); }

template <typename T, std::enable_if_t<std::is_floating_point_v<T>, bool> = true>
inline QByteArray toPdf(T v) { return QByteArray::number(v, 'f', 4); }

QByteArray toObjRef(ObjId id);
QByteArray toLiteralString(const QByteArray &s);
QByteArray toHexString(const QByteArray &s);
QByteArray toName(const QByteArray &s);
QByteArray toDateString(const QDateTime &dt);

// --- Resource dictionary ---

struct ResourceDict {
    QHash<QByteArray, ObjId> fonts;
    QHash<QByteArray, ObjId> xObjects;
    QHash<QByteArray, ObjId> extGState;
};

// --- Writer ---

class Writer {
public:
    Writer();

    bool openBuffer(QByteArray *buffer);
    bool close(bool aborted = false);

    void writeHeader();
    void writeXrefAndTrailer();
    void write(const QByteArray &bytes);
    void writeResourceDict(const ResourceDict &dict);

    // Object management
    ObjId newObject() { return m_objCounter++; }
    void startObj(ObjId id);
    ObjId startObj();
    void endObj(ObjId id);
    // Writes /Length (and /Filter) then the stream; the caller has
    // already opened the dictionary with "<<".
    void endObjectWithStream(ObjId id, const QByteArray &streamContent,
                             bool compress = true);

    ObjId catalogObj() const { return m_catalogObj; }
    ObjId infoObj() const { return m_infoObj; }
    ObjId pagesObj() const { return m_pagesObj; }

private:
    qint64 offset() const { return m_buffer ? m_buffer->size() : 0; }

    ObjId m_objCounter = 0;
    ObjId m_currentObj = 0;

    QByteArray *m_buffer = nullptr;
    QList<qint64> m_xref;       // byte offset per object id, 0 = free

    ObjId m_catalogObj = 0;
    ObjId m_infoObj = 0;
    ObjId m_pagesObj = 0;

    QByteArray m_fileId;
};

} // namespace Pdf

#endif // PAGESTAMP_PDFWRITER_H
