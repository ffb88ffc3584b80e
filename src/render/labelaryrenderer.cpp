/*
 * labelaryrenderer.cpp - HTTP client for the Labelary rendering API
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "labelaryrenderer.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>

#include <memory>

LabelaryRenderer::LabelaryRenderer(const Options &options)
    : m_options(options)
{
}

RenderResult LabelaryRenderer::render(const QString &payload, LabelSize size)
{
    RenderResult result;
    QElapsedTimer timer;
    timer.start();

    const QString sizeName = LabelSizes::toString(size);
    QUrl url(m_options.baseUrl
             + QStringLiteral("/v1/printers/%1dpmm/labels/%2")
                   .arg(m_options.dpmm)
                   .arg(sizeName));

    QNetworkRequest request(url);
    request.setRawHeader("Accept", "application/pdf");
    request.setHeader(QNetworkRequest::ContentTypeHeader,
                      QStringLiteral("application/x-www-form-urlencoded"));
    request.setTransferTimeout(m_options.timeoutMs);

    QNetworkAccessManager manager;
    QEventLoop loop;
    std::unique_ptr<QNetworkReply> reply(manager.post(request, payload.toUtf8()));
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished())
        loop.exec();

    result.responseTimeMs = static_cast<int>(timer.elapsed());
    result.httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray body = reply->readAll();

    if (result.httpStatus == 413) {
        result.status = RenderResult::PayloadTooLarge;
        result.errorMessage = QStringLiteral("Renderer rejected payload as too large");
    } else if (reply->error() == QNetworkReply::OperationCanceledError) {
        result.status = RenderResult::Transient;
        result.errorMessage = QStringLiteral("Renderer timed out after %1 ms").arg(m_options.timeoutMs);
    } else if (reply->error() != QNetworkReply::NoError || result.httpStatus != 200) {
        result.status = RenderResult::Transient;
        result.errorMessage = QStringLiteral("Renderer error %1: %2")
                                  .arg(result.httpStatus)
                                  .arg(reply->errorString());
    } else if (body.isEmpty()) {
        result.status = RenderResult::Transient;
        result.errorMessage = QStringLiteral("Renderer returned an empty document");
    } else {
        result.pdf = body;
        return result;
    }

    qWarning() << "LabelaryRenderer: request failed size=" << sizeName
               << "status=" << result.httpStatus
               << "error=" << result.errorMessage
               << "body=" << body.left(200);
    return result;
}
