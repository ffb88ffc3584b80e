/*
 * pdfwriter.h - Minimal PDF writer for offline label pages
 *
 * Writes into a QByteArray. Only base-14 fonts, one content stream per
 * page, and a flat page tree. Objects 1 to 3 are the catalog, the info
 * dictionary and the page tree; everything else is numbered in order.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_PDFWRITER_H
#define ZPLFORGE_PDFWRITER_H

#include <type_traits>

#include <QByteArray>
#include <QList>
#include <QSizeF>
#include <QString>

namespace Pdf {

using ObjId = uint32_t;

template <typename T, std::enable_if_t<std::is_integral_v<T>, bool> = true>
inline QByteArray toPdf(T v) { return QByteArray::number(static_cast<qlonglong>(v)); }

template <typename T, std::enable_if_t<std::is_floating_point_v<T>, bool> = true>
inline QByteArray toPdf(T v) { return QByteArray::number(v, 'f', 3); }

// (...) string; parentheses and backslashes escaped, other bytes outside
// printable ASCII as octal
QByteArray toLiteralString(const QByteArray &s);

class Writer {
public:
    bool openBuffer(QByteArray *buffer);
    // False when nothing was open or the document was never finished
    bool close();

    void writeHeader();

    ObjId writeStandardFont(const QByteArray &baseFont);

    ObjId writePage(const QSizeF &mediaBox, const QByteArray &content,
                    const QByteArray &fontName, ObjId fontObj);

    // Page tree, info and catalog, then the cross-reference table
    void finish(const QList<ObjId> &pages, const QString &producer);

private:
    static constexpr ObjId kCatalog = 1;
    static constexpr ObjId kInfo = 2;
    static constexpr ObjId kPages = 3;

    ObjId nextId() { return m_nextId++; }
    void writeObject(ObjId id, const QByteArray &body);
    void writeStream(ObjId id, const QByteArray &data);

    QByteArray *m_buffer = nullptr;
    QList<qint64> m_offsets;    // by object id, 0 when unused
    ObjId m_nextId = kPages + 1;
    bool m_finished = false;
};

} // namespace Pdf

#endif // ZPLFORGE_PDFWRITER_H
