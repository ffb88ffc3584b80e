/*
 * localobjectstore.cpp - ObjectStore backed by a local directory
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "localobjectstore.h"

#include <QCryptographicHash>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QMessageAuthenticationCode>
#include <QSaveFile>
#include <QUrl>
#include <QUrlQuery>

LocalObjectStore::LocalObjectStore(const QString &rootPath, const QByteArray &signingKey,
                                   int ttlSeconds)
    : m_root(rootPath)
    , m_signingKey(signingKey)
    , m_ttlSeconds(ttlSeconds > 0 ? ttlSeconds : 900)
{
    if (!m_root.exists() && !m_root.mkpath(QStringLiteral(".")))
        qWarning() << "LocalObjectStore: cannot create" << rootPath;
    if (m_signingKey.isEmpty()) {
        // Stable per root so URLs survive a restart
        m_signingKey = QCryptographicHash::hash(m_root.absolutePath().toUtf8(),
                                                QCryptographicHash::Sha256);
    }
}

QString LocalObjectStore::pathFor(const QString &key) const
{
    if (key.isEmpty() || key.startsWith(QLatin1Char('/')))
        return QString();
    const QString path = QDir::cleanPath(m_root.absoluteFilePath(key));
    const QString root = QDir::cleanPath(m_root.absolutePath()) + QLatin1Char('/');
    if (!path.startsWith(root))
        return QString();
    return path;
}

bool LocalObjectStore::put(const QString &key, const QByteArray &data,
                           const QString &contentType, QString *errorMessage)
{
    const QString path = pathFor(key);
    if (path.isEmpty()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Invalid storage key: %1").arg(key);
        return false;
    }

    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Cannot create directory for %1").arg(key);
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorMessage)
            *errorMessage = file.errorString();
        qWarning() << "LocalObjectStore: cannot open" << path << file.errorString();
        return false;
    }
    if (file.write(data) != data.size() || !file.commit()) {
        if (errorMessage)
            *errorMessage = file.errorString();
        qWarning() << "LocalObjectStore: write failed for" << key << file.errorString();
        return false;
    }

    qDebug() << "LocalObjectStore: stored" << key << data.size() << "bytes" << contentType;
    return true;
}

QByteArray LocalObjectStore::get(const QString &key, bool *ok) const
{
    if (ok)
        *ok = false;
    const QString path = pathFor(key);
    if (path.isEmpty())
        return QByteArray();

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return QByteArray();
    QByteArray data = file.readAll();
    if (ok)
        *ok = true;
    return data;
}

bool LocalObjectStore::remove(const QString &key)
{
    const QString path = pathFor(key);
    if (path.isEmpty() || !QFile::exists(path))
        return false;
    return QFile::remove(path);
}

QString LocalObjectStore::token(const QString &key, qint64 expires, const QString &downloadName) const
{
    const QByteArray message = key.toUtf8() + '\n' + QByteArray::number(expires) + '\n'
        + downloadName.toUtf8();
    return QString::fromLatin1(
        QMessageAuthenticationCode::hash(message, m_signingKey, QCryptographicHash::Sha256).toHex());
}

ObjectStore::SignedUrl LocalObjectStore::sign(const QString &key, const QString &downloadName) const
{
    SignedUrl signedUrl;
    const QString path = pathFor(key);
    if (path.isEmpty() || !QFile::exists(path)) {
        qWarning() << "LocalObjectStore: cannot sign missing object" << key;
        return signedUrl;
    }

    signedUrl.expiresAt = QDateTime::currentDateTimeUtc().addSecs(m_ttlSeconds);
    const qint64 expires = signedUrl.expiresAt.toSecsSinceEpoch();

    QUrlQuery query;
    query.addQueryItem(QStringLiteral("expires"), QString::number(expires));
    query.addQueryItem(QStringLiteral("name"), downloadName);
    query.addQueryItem(QStringLiteral("token"), token(key, expires, downloadName));

    QUrl url = QUrl::fromLocalFile(path);
    url.setQuery(query);
    signedUrl.url = url.toString(QUrl::FullyEncoded);
    return signedUrl;
}

bool LocalObjectStore::verify(const QString &key, qint64 expires, const QString &downloadName,
                              const QString &providedToken, const QDateTime &now) const
{
    if (now.toSecsSinceEpoch() > expires)
        return false;
    return token(key, expires, downloadName) == providedToken;
}
