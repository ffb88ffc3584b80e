#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QTextStream>
#include <QThread>

#include <KAboutData>
#include <KLocalizedString>

#include <memory>

#include "batchorchestrator.h"
#include "conversionpipeline.h"
#include "conversionservice.h"
#include "jobstore.h"
#include "labelaryrenderer.h"
#include "localobjectstore.h"
#include "placeholderrenderer.h"
#include "planusagelimits.h"
#include "renderdispatcher.h"
#include "settings.h"

namespace {

bool readZpl(const QString &path, QString *text, QTextStream &err)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        err << i18n("Cannot read %1: %2", path, file.errorString()) << Qt::endl;
        return false;
    }
    *text = QString::fromUtf8(file.readAll());
    return true;
}

bool writeOutput(const QString &path, const QByteArray &data, QTextStream &err)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly) || file.write(data) != data.size()) {
        err << i18n("Cannot write %1: %2", path, file.errorString()) << Qt::endl;
        return false;
    }
    return true;
}

QString describe(const ConversionError &error)
{
    QString text = QStringLiteral("%1: %2").arg(ConversionError::codeName(error.code), error.message);
    if (!error.context.isEmpty())
        text += QLatin1Char(' ') + QString::fromUtf8(QJsonDocument(error.context).toJson(QJsonDocument::Compact));
    return text;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("zplforge");

    KAboutData aboutData(
        QStringLiteral("zplforge"),
        i18n("ZplForge"),
        QStringLiteral("0.1.0"),
        i18n("Batch renderer for ZPL label documents"),
        KAboutLicense::GPL_V3,
        i18n("(c) 2026")
    );
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.addOptions({
        {QStringLiteral("size"), i18n("Label size: 2x1, 2x4, 4x2, 4x6."), QStringLiteral("size"), QStringLiteral("2x1")},
        {QStringLiteral("format"), i18n("Output format: pdf, png, jpeg."), QStringLiteral("format"), QStringLiteral("pdf")},
        {QStringLiteral("plan"), i18n("Plan tier: free, pro, promax, enterprise."), QStringLiteral("plan"), QStringLiteral("pro")},
        {QStringLiteral("user"), i18n("User id the conversion is accounted to."), QStringLiteral("id"), QStringLiteral("local")},
        {QStringLiteral("config"), i18n("Configuration file to read instead of zplforgerc."), QStringLiteral("file")},
        {QStringLiteral("count"), i18n("Only count labels, do not render.")},
        {QStringLiteral("offline"), i18n("Render with the built-in placeholder renderer.")},
        {{QStringLiteral("o"), QStringLiteral("output")}, i18n("Where to write the result."), QStringLiteral("path")},
    });
    parser.addPositionalArgument(
        QStringLiteral("file"),
        i18n("ZPL file(s) to convert; several files form one batch"),
        QStringLiteral("file..."));
    parser.process(app);
    aboutData.processCommandLine(&parser);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList files = parser.positionalArguments();
    if (files.isEmpty()) {
        parser.showHelp(1);
    }

    if (parser.isSet(QStringLiteral("count"))) {
        int status = 0;
        for (const QString &path : files) {
            QString zpl;
            if (!readZpl(path, &zpl, err)) {
                status = 1;
                continue;
            }
            const BlockParser::LabelCount count = BlockParser::countLabels(zpl);
            if (count.error.isError()) {
                err << path << ": " << describe(count.error) << Qt::endl;
                status = 1;
                continue;
            }
            out << path << ": " << i18n("%1 unique label(s), %2 label(s) in total",
                                        count.totalUniqueLabels, count.totalLabels) << Qt::endl;
        }
        return status;
    }

    const Settings settings = Settings::load(parser.value(QStringLiteral("config")));
    const LabelSize labelSize = LabelSizes::fromString(parser.value(QStringLiteral("size")));
    const OutputFormat format = OutputFormats::fromString(parser.value(QStringLiteral("format")));
    const PlanTier tier = PlanTiers::fromString(parser.value(QStringLiteral("plan")));
    const QString userId = parser.value(QStringLiteral("user"));

    std::shared_ptr<Renderer> renderer;
    if (settings.offline || parser.isSet(QStringLiteral("offline")))
        renderer = std::make_shared<PlaceholderRenderer>(settings.dispatcher.labelCap);
    else
        renderer = std::make_shared<LabelaryRenderer>(settings.labelary);

    RenderDispatcher dispatcher(renderer, settings.dispatcher);
    ConversionPipeline pipeline(dispatcher, settings.images);
    InMemoryJobStore jobs;
    LocalObjectStore store(settings.storageRoot, settings.signingKey, settings.signedUrlTtlSeconds);
    PlanUsageLimits usage;
    for (auto it = settings.quotas.cbegin(); it != settings.quotas.cend(); ++it)
        usage.setQuota(it.key(), it.value());

    const QString outputPath = parser.value(QStringLiteral("output"));

    if (files.size() == 1) {
        QString zpl;
        if (!readZpl(files.first(), &zpl, err))
            return 1;

        ConversionService service(pipeline, dispatcher, jobs, store, usage, settings.workerThreads);
        ConversionService::Request request;
        request.userId = userId;
        request.tier = tier;
        request.zpl = zpl;
        request.labelSize = labelSize;
        request.format = format;

        const ConversionService::StartResult started = service.start(request);
        if (!started.ok()) {
            err << describe(started.error) << Qt::endl;
            return 1;
        }

        QString lastMessage;
        for (;;) {
            const std::optional<ConversionJob> job = service.status(started.jobId);
            if (!job)
                break;
            if (job->statusMessage() != lastMessage) {
                lastMessage = job->statusMessage();
                out << lastMessage << Qt::endl;
            }
            if (job->isTerminal())
                break;
            QThread::msleep(200);
        }
        service.waitForDone();

        const std::optional<ConversionJob> job = service.status(started.jobId);
        if (!job || job->status != ConversionJob::Completed) {
            if (job)
                err << describe(job->error) << Qt::endl;
            return 1;
        }

        const QString target = outputPath.isEmpty() ? job->fileName : outputPath;
        bool ok = false;
        const QByteArray data = store.get(job->storageKey, &ok);
        if (!ok || !writeOutput(target, data, err))
            return 1;
        out << i18n("%1 page(s) written to %2", job->pageCount, target) << Qt::endl;
        if (job->skippedLabels > 0)
            out << i18n("%1 label(s) could not be included", job->skippedLabels) << Qt::endl;
        return 0;
    }

    QList<BatchOrchestrator::InputFile> inputs;
    for (const QString &path : files) {
        BatchOrchestrator::InputFile input;
        input.name = QFileInfo(path).fileName();
        if (!readZpl(path, &input.zpl, err))
            return 1;
        inputs.append(input);
    }

    BatchOrchestrator orchestrator(pipeline, jobs, store, usage, settings.batch);
    const BatchOrchestrator::SubmitResult submitted =
        orchestrator.submit(userId, tier, inputs, labelSize, format);
    if (!submitted.ok()) {
        err << describe(submitted.error) << Qt::endl;
        return 1;
    }
    orchestrator.waitForDone();

    const std::optional<BatchJob> batch = orchestrator.batch(submitted.batchId);
    if (!batch)
        return 1;

    for (const FileJob &f : batch->files) {
        out << f.fileName << ": " << FileJob::statusName(f.status);
        if (f.error.isError())
            out << " (" << f.error.message << ')';
        out << Qt::endl;
    }
    out << i18n("Batch %1", BatchJob::statusName(batch->status)) << Qt::endl;

    if (batch->status == BatchJob::Failed) {
        if (batch->error.isError())
            err << describe(batch->error) << Qt::endl;
        return 1;
    }

    const QString target = outputPath.isEmpty() ? batch->archiveFileName : outputPath;
    bool ok = false;
    const QByteArray archive = store.get(batch->archiveKey, &ok);
    if (!ok || !writeOutput(target, archive, err))
        return 1;
    out << i18n("Archive written to %1", target) << Qt::endl;
    return batch->status == BatchJob::Completed ? 0 : 2;
}
