/*
 * placeholderrenderer.h - Offline stand-in for the rendering service
 *
 * Produces one page per block with the block's ordinal and its ^FD field
 * text drawn in Helvetica. Used when the real service is unreachable
 * (Renderer/Offline=true) and by the test suite, which reads the text back
 * to verify page order.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_PLACEHOLDERRENDERER_H
#define ZPLFORGE_PLACEHOLDERRENDERER_H

#include "renderer.h"

class PlaceholderRenderer : public Renderer
{
public:
    // Payloads with more than labelCap blocks are refused the way the
    // real service refuses them (HTTP 413).
    explicit PlaceholderRenderer(int labelCap = 50);

    RenderResult render(const QString &payload, LabelSize size) override;
    QString name() const override { return QStringLiteral("offline"); }

    static QByteArray pageContent(const QString &block, int ordinal,
                                  const QSizeF &pageSize);

private:
    int m_labelCap;
};

#endif // ZPLFORGE_PLACEHOLDERRENDERER_H
