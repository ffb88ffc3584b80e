/*
 * pdfwriter.cpp - Minimal PDF writer for offline label pages
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfwriter.h"

#include <QCryptographicHash>
#include <QDateTime>

#include <zlib.h>

namespace Pdf {

QByteArray toLiteralString(const QByteArray &s)
{
    QByteArray out("(");
    for (char ch : s) {
        const uchar c = static_cast<uchar>(ch);
        if (c == '(' || c == ')' || c == '\\') {
            out += '\\';
            out += ch;
        } else if (c < 32 || c > 126) {
            out += '\\' + QByteArray::number(c, 8).rightJustified(3, '0');
        } else {
            out += ch;
        }
    }
    return out + ')';
}

static QByteArray ref(ObjId id)
{
    return toPdf(id) + " 0 R";
}

bool Writer::openBuffer(QByteArray *buffer)
{
    if (!buffer)
        return false;
    m_buffer = buffer;
    m_buffer->clear();
    m_offsets = QList<qint64>(kPages + 1, 0);
    m_nextId = kPages + 1;
    m_finished = false;
    return true;
}

bool Writer::close()
{
    if (!m_buffer)
        return false;
    const bool complete = m_finished;
    if (!complete)
        m_buffer->clear();
    m_buffer = nullptr;
    return complete;
}

void Writer::writeHeader()
{
    // Binary marker line after the version
    m_buffer->append("%PDF-1.7\n%\xe2\xe3\xcf\xd3\n");
}

void Writer::writeObject(ObjId id, const QByteArray &body)
{
    if (m_offsets.size() <= static_cast<int>(id))
        m_offsets.resize(id + 1);
    m_offsets[id] = m_buffer->size();
    m_buffer->append(toPdf(id) + " 0 obj\n" + body + "\nendobj\n");
}

void Writer::writeStream(ObjId id, const QByteArray &data)
{
    uLongf packedLen = compressBound(static_cast<uLong>(data.size()));
    QByteArray packed(static_cast<int>(packedLen), Qt::Uninitialized);
    const int zret = ::compress2(reinterpret_cast<Bytef *>(packed.data()), &packedLen,
                                 reinterpret_cast<const Bytef *>(data.constData()),
                                 static_cast<uLong>(data.size()), Z_BEST_SPEED);

    QByteArray dict = "<< /Length ";
    QByteArray payload = data;
    if (zret == Z_OK && packedLen < static_cast<uLongf>(data.size())) {
        packed.truncate(static_cast<int>(packedLen));
        payload = packed;
        dict += toPdf(payload.size()) + " /Filter /FlateDecode >>";
    } else {
        dict += toPdf(payload.size()) + " >>";
    }
    writeObject(id, dict + "\nstream\n" + payload + "\nendstream");
}

ObjId Writer::writeStandardFont(const QByteArray &baseFont)
{
    const ObjId id = nextId();
    writeObject(id, "<< /Type /Font /Subtype /Type1 /BaseFont /" + baseFont
                        + " /Encoding /WinAnsiEncoding >>");
    return id;
}

ObjId Writer::writePage(const QSizeF &mediaBox, const QByteArray &content,
                        const QByteArray &fontName, ObjId fontObj)
{
    const ObjId contentId = nextId();
    writeStream(contentId, content);

    const ObjId pageId = nextId();
    writeObject(pageId, "<< /Type /Page /Parent " + ref(kPages)
                            + " /MediaBox [0 0 " + toPdf(mediaBox.width()) + ' '
                            + toPdf(mediaBox.height()) + "] /Contents " + ref(contentId)
                            + " /Resources << /Font << /" + fontName + ' ' + ref(fontObj)
                            + " >> >> >>");
    return pageId;
}

void Writer::finish(const QList<ObjId> &pages, const QString &producer)
{
    QByteArray kids;
    for (ObjId page : pages)
        kids += ref(page) + ' ';
    writeObject(kPages, "<< /Type /Pages /Kids [" + kids.trimmed() + "] /Count "
                            + toPdf(pages.size()) + " >>");

    const QByteArray now = QDateTime::currentDateTimeUtc()
                               .toString(QStringLiteral("yyyyMMddHHmmss")).toLatin1();
    writeObject(kInfo, "<< /Producer " + toLiteralString(producer.toLatin1())
                           + " /CreationDate (D:" + now + "Z) >>");
    writeObject(kCatalog, "<< /Type /Catalog /Pages " + ref(kPages) + " >>");

    const qint64 xrefAt = m_buffer->size();
    QByteArray xref = "xref\n0 " + toPdf(m_offsets.size()) + "\n";
    xref += "0000000000 65535 f \n";
    for (int i = 1; i < m_offsets.size(); ++i)
        xref += QByteArray::number(m_offsets[i]).rightJustified(10, '0') + " 00000 n \n";

    // Same bytes in, same identifier out
    const QByteArray id = QCryptographicHash::hash(*m_buffer, QCryptographicHash::Md5).toHex();
    xref += "trailer\n<< /Size " + toPdf(m_offsets.size()) + " /Root " + ref(kCatalog)
            + " /Info " + ref(kInfo) + " /ID [<" + id + "> <" + id + ">] >>\n";
    xref += "startxref\n" + toPdf(xrefAt) + "\n%%EOF\n";
    m_buffer->append(xref);
    m_finished = true;
}

} // namespace Pdf
