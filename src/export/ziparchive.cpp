/*
 * ziparchive.cpp - In-memory zip archives
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "ziparchive.h"

#include <QDebug>

#include <zip.h>

#include <cstdio>

namespace {

// Opens an archive over a copy-free view of the bytes; the caller keeps
// the QByteArray alive until zip_close/zip_discard.
zip_t *openReadOnly(const QByteArray &archive)
{
    zip_error_t error;
    zip_error_init(&error);
    zip_source_t *src = zip_source_buffer_create(archive.constData(),
                                                 static_cast<zip_uint64_t>(archive.size()), 0, &error);
    if (!src) {
        qWarning() << "ZipArchive: cannot wrap buffer:" << zip_error_strerror(&error);
        zip_error_fini(&error);
        return nullptr;
    }
    zip_t *za = zip_open_from_source(src, ZIP_RDONLY, &error);
    if (!za) {
        qWarning() << "ZipArchive: cannot open archive:" << zip_error_strerror(&error);
        zip_source_free(src);
    }
    zip_error_fini(&error);
    return za;
}

} // namespace

void ZipArchive::addFile(const QString &name, const QByteArray &data)
{
    for (Entry &e : m_entries) {
        if (e.name == name) {
            e.data = data;
            return;
        }
    }
    m_entries.append({name, data});
}

ZipArchive::Result ZipArchive::build() const
{
    Result result;

    zip_error_t error;
    zip_error_init(&error);
    zip_source_t *sink = zip_source_buffer_create(nullptr, 0, 0, &error);
    if (!sink) {
        result.errorMessage = QString::fromUtf8(zip_error_strerror(&error));
        zip_error_fini(&error);
        return result;
    }
    // Keep the buffer source after zip_close so the bytes can be read back
    zip_source_keep(sink);

    zip_t *za = zip_open_from_source(sink, ZIP_TRUNCATE, &error);
    if (!za) {
        result.errorMessage = QString::fromUtf8(zip_error_strerror(&error));
        zip_error_fini(&error);
        zip_source_free(sink);
        return result;
    }
    zip_error_fini(&error);

    for (const Entry &e : m_entries) {
        zip_source_t *src = zip_source_buffer(za, e.data.constData(),
                                              static_cast<zip_uint64_t>(e.data.size()), 0);
        if (!src || zip_file_add(za, e.name.toUtf8().constData(), src,
                                 ZIP_FL_ENC_UTF_8 | ZIP_FL_OVERWRITE) < 0) {
            result.errorMessage = QStringLiteral("Cannot add %1: %2")
                                      .arg(e.name, QString::fromUtf8(zip_strerror(za)));
            if (src)
                zip_source_free(src);
            zip_discard(za);
            zip_source_free(sink);
            return result;
        }
    }

    if (zip_close(za) < 0) {
        result.errorMessage = QString::fromUtf8(zip_strerror(za));
        zip_discard(za);
        zip_source_free(sink);
        return result;
    }

    if (zip_source_open(sink) < 0) {
        result.errorMessage = QStringLiteral("Cannot reopen archive buffer");
        zip_source_free(sink);
        return result;
    }
    zip_source_seek(sink, 0, SEEK_END);
    const zip_int64_t size = zip_source_tell(sink);
    zip_source_seek(sink, 0, SEEK_SET);

    if (size > 0) {
        result.data.resize(static_cast<qsizetype>(size));
        const zip_int64_t read = zip_source_read(sink, result.data.data(),
                                                 static_cast<zip_uint64_t>(size));
        if (read != size) {
            result.data.clear();
            result.errorMessage = QStringLiteral("Short read from archive buffer");
        }
    } else {
        result.errorMessage = QStringLiteral("Archive buffer is empty");
    }
    zip_source_close(sink);
    zip_source_free(sink);

    result.valid = result.errorMessage.isEmpty();
    return result;
}

QStringList ZipArchive::entryNames(const QByteArray &archive)
{
    QStringList names;
    zip_t *za = openReadOnly(archive);
    if (!za)
        return names;

    const zip_int64_t total = zip_get_num_entries(za, 0);
    for (zip_int64_t i = 0; i < total; ++i) {
        const char *name = zip_get_name(za, static_cast<zip_uint64_t>(i), ZIP_FL_ENC_GUESS);
        if (name)
            names.append(QString::fromUtf8(name));
    }
    zip_discard(za);
    return names;
}

QByteArray ZipArchive::readEntry(const QByteArray &archive, const QString &name)
{
    QByteArray contents;
    zip_t *za = openReadOnly(archive);
    if (!za)
        return contents;

    const QByteArray entryName = name.toUtf8();
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat(za, entryName.constData(), 0, &st) == 0 && (st.valid & ZIP_STAT_SIZE)) {
        zip_file_t *file = zip_fopen(za, entryName.constData(), 0);
        if (file) {
            contents.resize(static_cast<qsizetype>(st.size));
            const zip_int64_t read = zip_fread(file, contents.data(), st.size);
            zip_fclose(file);
            if (read < 0 || static_cast<zip_uint64_t>(read) != st.size)
                contents.clear();
        }
    }
    zip_discard(za);
    return contents;
}
