/*
 * renderer.h - Interface to the external ZPL rendering service
 *
 * A renderer turns a payload of one or more ^XA ... ^XZ blocks into a PDF
 * holding one page per block, in payload order. Implementations are called
 * from the dispatcher's worker threads and must be safe to call
 * concurrently.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_RENDERER_H
#define ZPLFORGE_RENDERER_H

#include <QByteArray>
#include <QString>

#include "labelsize.h"

struct RenderResult {
    enum Status {
        Ok,
        PayloadTooLarge,    // chunking contract violated, never retried
        Transient,          // timeout, 5xx, 429, network
        Shutdown,           // dispatcher stopped before the call was made
    };

    Status status = Ok;
    QByteArray pdf;
    int httpStatus = 0;
    int responseTimeMs = 0;
    QString errorMessage;

    bool ok() const { return status == Ok; }
};

class Renderer
{
public:
    virtual ~Renderer() = default;

    virtual RenderResult render(const QString &payload, LabelSize size) = 0;

    // Short name for logs
    virtual QString name() const = 0;
};

#endif // ZPLFORGE_RENDERER_H
