/*
 * objectstore.h - Storage for finished conversion outputs
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_OBJECTSTORE_H
#define ZPLFORGE_OBJECTSTORE_H

#include <QByteArray>
#include <QDateTime>
#include <QString>

class ObjectStore
{
public:
    struct SignedUrl {
        QString url;
        QDateTime expiresAt;
        bool isValid() const { return !url.isEmpty(); }
    };

    virtual ~ObjectStore() = default;

    // Keys are relative slash-separated paths such as "labels/label-<id>.pdf"
    virtual bool put(const QString &key, const QByteArray &data,
                     const QString &contentType, QString *errorMessage = nullptr) = 0;
    virtual QByteArray get(const QString &key, bool *ok = nullptr) const = 0;
    virtual bool remove(const QString &key) = 0;

    // Time-limited download link; downloadName is the file name offered to
    // the user agent.
    virtual SignedUrl sign(const QString &key, const QString &downloadName) const = 0;
};

#endif // ZPLFORGE_OBJECTSTORE_H
