/*
 * pdfwriter.cpp - Low-level PDF object writer
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfwriter.h"

#include <algorithm>

#include <QCryptographicHash>
#include <QtGlobal>
#include <zlib.h>

namespace Pdf {

static const char kHexDigits[] = "0123456789ABCDEF";

static bool isDelimiter(char c)
{
    return QByteArray("()<>[]{}/%").contains(c);
}

// --- WinAnsi (Windows-1252, PDF32000-2008 Annex D.2) ---

uchar toWinAnsi(QChar c)
{
    const ushort u = c.unicode();
    if (u == '\t' || u == '\n' || u == '\r')
        return ' ';
    if ((u >= 32 && u <= 126) || (u >= 160 && u <= 255))
        return static_cast<uchar>(u);

    switch (u) {
    case 0x20AC: return 0x80; case 0x201A: return 0x82; case 0x0192: return 0x83;
    case 0x201E: return 0x84; case 0x2026: return 0x85; case 0x2020: return 0x86;
    case 0x2021: return 0x87; case 0x02C6: return 0x88; case 0x2030: return 0x89;
    case 0x0160: return 0x8A; case 0x2039: return 0x8B; case 0x0152: return 0x8C;
    case 0x017D: return 0x8E; case 0x2018: return 0x91; case 0x2019: return 0x92;
    case 0x201C: return 0x93; case 0x201D: return 0x94; case 0x2022: return 0x95;
    case 0x2013: return 0x96; case 0x2014: return 0x97; case 0x02DC: return 0x98;
    case 0x2122: return 0x99; case 0x0161: return 0x9A; case 0x203A: return 0x9B;
    case 0x0153: return 0x9C; case 0x017E: return 0x9E; case 0x0178: return 0x9F;
    default:
        return '?';
    }
}

QByteArray toWinAnsi(const QString &s)
{
    QByteArray result;
    result.reserve(s.length());
    for (const QChar c : s)
        result.append(static_cast<char>(toWinAnsi(c)));
    return result;
}

QByteArray toUTF16(const QString &s)
{
    QByteArray result;
    result.reserve(2 + s.length() * 2);
    result.append('\xfe');
    result.append('\xff');
    for (const QChar c : s) {
        result.append(static_cast<char>(c.row()));
        result.append(static_cast<char>(c.cell()));
    }
    return result;
}

QByteArray toPdf(bool v)
{
    return v ? "true" : "false";
}

QByteArray toObjRef(ObjId id)
{
    return toPdf(id) + " 0 R";
}

QByteArray toLiteralString(const QByteArray &s)
{
    QByteArray result("(");
    for (const char ch : s) {
        const uchar v = static_cast<uchar>(ch);
        if (v == '(' || v == ')' || v == '\\') {
            result.append('\\');
            result.append(ch);
        } else if (v < 32 || v >= 127) {
            // Octal escape keeps content streams 7-bit clean
            result.append('\\');
            result.append("01234567"[(v >> 6) & 7]);
            result.append("01234567"[(v >> 3) & 7]);
            result.append("01234567"[v & 7]);
        } else {
            result.append(ch);
        }
    }
    result.append(')');
    return result;
}

QByteArray toHexString(const QByteArray &s)
{
    QByteArray result("<");
    for (const char ch : s) {
        const uchar v = static_cast<uchar>(ch);
        result.append(kHexDigits[v >> 4]);
        result.append(kHexDigits[v & 0xf]);
    }
    result.append('>');
    return result;
}

QByteArray toName(const QByteArray &s)
{
    QByteArray result("/");
    for (const char ch : s) {
        const uchar c = static_cast<uchar>(ch);
        if (c <= 32 || c >= 127 || c == '#' || isDelimiter(ch)) {
            result.append('#');
            result.append(kHexDigits[c >> 4]);
            result.append(kHexDigits[c & 0xf]);
        } else {
            result.append(ch);
        }
    }
    return result;
}

QByteArray toDateString(const QDateTime &dt)
{
    return "D:" + dt.toUTC().toString(QStringLiteral("yyyyMMddHHmmss")).toLatin1() + "Z";
}

// --- Writer ---

Writer::Writer()
{
    m_fileId = QCryptographicHash::hash(
        QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toUtf8(),
        QCryptographicHash::Md5);
}

bool Writer::openBuffer(QByteArray *buffer)
{
    if (!buffer)
        return false;
    m_buffer = buffer;
    m_buffer->clear();
    m_xref.clear();
    m_currentObj = 0;
    // 1 = catalog, 2 = info, 3 = page tree
    m_catalogObj = 1;
    m_infoObj = 2;
    m_pagesObj = 3;
    m_objCounter = 4;
    return true;
}

bool Writer::close(bool aborted)
{
    if (!m_buffer)
        return false;
    if (aborted)
        m_buffer->clear();
    m_buffer = nullptr;
    return !aborted;
}

void Writer::write(const QByteArray &bytes)
{
    if (!m_buffer)
        return;
    m_buffer->append(bytes);
}

void Writer::writeHeader()
{
    write("%PDF-1.7\n");
    write("%\xc7\xec\x8f\xa2\n"); // binary marker
}

void Writer::writeXrefAndTrailer()
{
    const qint64 startXref = offset();
    while (static_cast<ObjId>(m_xref.size()) < m_objCounter)
        m_xref.append(0);

    write("xref\n0 " + toPdf(m_xref.size()) + "\n");
    for (int i = 0; i < m_xref.size(); ++i) {
        if (m_xref[i] > 0)
            write(QByteArray::number(m_xref[i]).rightJustified(10, '0') + " 00000 n \n");
        else
            write("0000000000 65535 f \n");
    }

    const QByteArray idHex = toHexString(m_fileId);
    write("trailer\n<<\n");
    write("/Size " + toPdf(m_xref.size()) + "\n");
    write("/Root " + toObjRef(m_catalogObj) + "\n");
    write("/Info " + toObjRef(m_infoObj) + "\n");
    write("/ID [" + idHex + idHex + "]\n");
    write(">>\nstartxref\n" + toPdf(startXref) + "\n%%EOF\n");
}

void Writer::writeResourceDict(const ResourceDict &dict)
{
    auto writeSection = [this](const char *key, const QHash<QByteArray, ObjId> &entries) {
        if (entries.isEmpty())
            return;
        // Sorted for byte-identical output across runs
        QList<QByteArray> names = entries.keys();
        std::sort(names.begin(), names.end());
        write(QByteArray(key) + " <<\n");
        for (const QByteArray &name : names)
            write(toName(name) + " " + toObjRef(entries.value(name)) + "\n");
        write(">>\n");
    };

    write("<< /ProcSet [/PDF /Text /ImageC]\n");
    writeSection("/Font", dict.fonts);
    writeSection("/XObject", dict.xObjects);
    writeSection("/ExtGState", dict.extGState);
    write(">>");
}

void Writer::startObj(ObjId id)
{
    Q_ASSERT(m_currentObj == 0);
    m_currentObj = id;
    while (static_cast<ObjId>(m_xref.size()) <= id)
        m_xref.append(0);
    m_xref[id] = offset();
    write(toPdf(id) + " 0 obj\n");
}

ObjId Writer::startObj()
{
    const ObjId id = newObject();
    startObj(id);
    return id;
}

void Writer::endObj(ObjId id)
{
    Q_ASSERT(m_currentObj == id);
    Q_UNUSED(id);
    m_currentObj = 0;
    write("\nendobj\n");
}

void Writer::endObjectWithStream(ObjId id, const QByteArray &streamContent, bool compress)
{
    QByteArray data = streamContent;
    bool compressed = false;
    if (compress && streamContent.size() > 64) {
        uLongf destLen = compressBound(static_cast<uLong>(streamContent.size()));
        QByteArray packed(static_cast<int>(destLen), Qt::Uninitialized);
        const int zret = ::compress2(reinterpret_cast<Bytef *>(packed.data()), &destLen,
                                     reinterpret_cast<const Bytef *>(streamContent.constData()),
                                     static_cast<uLong>(streamContent.size()),
                                     Z_DEFAULT_COMPRESSION);
        if (zret == Z_OK) {
            packed.resize(static_cast<int>(destLen));
            data = packed;
            compressed = true;
        }
    }

    write("/Length " + toPdf(data.size()) + "\n");
    if (compressed)
        write("/Filter /FlateDecode\n");
    write(">>\nstream\n");
    write(data);
    write("\nendstream");
    endObj(id);
}

} // namespace Pdf
