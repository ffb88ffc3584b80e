/*
 * localobjectstore.h - ObjectStore backed by a local directory
 *
 * Signed URLs are file:// URLs carrying the expiry, the download name and
 * an HMAC-SHA256 token over both, so a front end serving the directory can
 * check them with verify().
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_LOCALOBJECTSTORE_H
#define ZPLFORGE_LOCALOBJECTSTORE_H

#include <QDir>

#include "objectstore.h"

class LocalObjectStore : public ObjectStore
{
public:
    LocalObjectStore(const QString &rootPath, const QByteArray &signingKey, int ttlSeconds = 900);

    bool put(const QString &key, const QByteArray &data,
             const QString &contentType, QString *errorMessage = nullptr) override;
    QByteArray get(const QString &key, bool *ok = nullptr) const override;
    bool remove(const QString &key) override;
    SignedUrl sign(const QString &key, const QString &downloadName) const override;

    bool verify(const QString &key, qint64 expires, const QString &downloadName,
                const QString &token, const QDateTime &now = QDateTime::currentDateTimeUtc()) const;

    QString rootPath() const { return m_root.absolutePath(); }

private:
    // Absolute path for key, or empty when the key escapes the root
    QString pathFor(const QString &key) const;
    QString token(const QString &key, qint64 expires, const QString &downloadName) const;

    QDir m_root;
    QByteArray m_signingKey;
    int m_ttlSeconds;
};

#endif // ZPLFORGE_LOCALOBJECTSTORE_H
