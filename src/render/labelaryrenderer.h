/*
 * labelaryrenderer.h - HTTP client for the Labelary rendering API
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_LABELARYRENDERER_H
#define ZPLFORGE_LABELARYRENDERER_H

#include <QString>

#include "renderer.h"

class LabelaryRenderer : public Renderer
{
public:
    struct Options {
        QString baseUrl = QStringLiteral("http://api.labelary.com");
        int dpmm = 8;
        int timeoutMs = 60000;
    };

    explicit LabelaryRenderer(const Options &options);

    // Blocks the calling thread on a local event loop until the reply
    // arrives. Each call owns its own QNetworkAccessManager, so calls from
    // different threads do not share state.
    RenderResult render(const QString &payload, LabelSize size) override;
    QString name() const override { return QStringLiteral("labelary"); }

private:
    Options m_options;
};

#endif // ZPLFORGE_LABELARYRENDERER_H
