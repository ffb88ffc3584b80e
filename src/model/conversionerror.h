/*
 * conversionerror.h - Error value carried through the conversion pipeline
 *
 * Stages report failure by value. Code is the machine-readable category,
 * message is human readable and context carries the numbers a caller
 * needs (requested vs. allowed, HTTP status, ...).
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_CONVERSIONERROR_H
#define ZPLFORGE_CONVERSIONERROR_H

#include <QJsonObject>
#include <QString>

struct ConversionError {
    enum Code {
        None,
        EmptyContent,
        NoValidBlocks,
        CapacityExceeded,
        RendererFailed,
        RendererShutdown,
        EmptyDocument,
        ArchiveFailed,
        StorageFailed,
        LimitDenied,
        BatchNotAllowed,
        TooManyFiles,
        FileTooLarge,
        NotFound,
        NotReady,
    };

    Code code = None;
    QString message;
    QJsonObject context;

    bool isError() const { return code != None; }

    static ConversionError make(Code code, const QString &message,
                                const QJsonObject &context = {})
    {
        ConversionError e;
        e.code = code;
        e.message = message;
        e.context = context;
        return e;
    }

    // Stable identifier used in logs and status payloads
    static QString codeName(Code code);
};

#endif // ZPLFORGE_CONVERSIONERROR_H
