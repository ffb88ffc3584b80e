/*
 * ziparchive.h - In-memory zip archives
 *
 * Entries are collected first and written in one go; the archive never
 * touches the file system.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_ZIPARCHIVE_H
#define ZPLFORGE_ZIPARCHIVE_H

#include <QByteArray>
#include <QList>
#include <QString>
#include <QStringList>

class ZipArchive
{
public:
    struct Result {
        QByteArray data;
        bool valid = false;
        QString errorMessage;
    };

    // Later entries with the same name replace earlier ones
    void addFile(const QString &name, const QByteArray &data);

    int entryCount() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }

    Result build() const;

    // Entry names of an existing archive, in archive order. Empty on error.
    static QStringList entryNames(const QByteArray &archive);
    static QByteArray readEntry(const QByteArray &archive, const QString &name);

private:
    struct Entry {
        QString name;
        QByteArray data;
    };
    QList<Entry> m_entries;
};

#endif // ZPLFORGE_ZIPARCHIVE_H
