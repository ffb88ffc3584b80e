#include <catch2/catch.hpp>

#include <QDir>
#include <QRegularExpression>
#include <QTemporaryDir>
#include <QThread>
#include <QUrl>
#include <QUrlQuery>

#include "conversionpipeline.h"
#include "conversionservice.h"
#include "jobstore.h"
#include "localobjectstore.h"
#include "planusagelimits.h"
#include "renderdispatcher.h"
#include "testhelpers.h"
#include "ziparchive.h"

using TestHelpers::label;

namespace {

struct ServiceRig {
    explicit ServiceRig(std::shared_ptr<TestHelpers::RecordingRenderer> r =
                            std::make_shared<TestHelpers::RecordingRenderer>())
        : renderer(std::move(r))
        , dispatcher(renderer, dispatcherOptions())
        , pipeline(dispatcher, imageOptions())
        , store(dir.path(), QByteArray("secret"), 600)
        , service(pipeline, dispatcher, jobs, store, usage, 2)
    {
    }

    static RenderDispatcher::Options dispatcherOptions()
    {
        RenderDispatcher::Options options;
        options.labelCap = 2;
        options.minIntervalMs = 0;
        return options;
    }

    static ImageExporter::Options imageOptions()
    {
        ImageExporter::Options options;
        options.dpi = 72;
        return options;
    }

    ConversionService::Request request(const QString &zpl, PlanTier tier = PlanTier::Pro,
                                       OutputFormat format = OutputFormat::Pdf) const
    {
        ConversionService::Request r;
        r.userId = QStringLiteral("alice");
        r.tier = tier;
        r.zpl = zpl;
        r.labelSize = LabelSize::FourBySix;
        r.format = format;
        return r;
    }

    QTemporaryDir dir;
    std::shared_ptr<TestHelpers::RecordingRenderer> renderer;
    RenderDispatcher dispatcher;
    ConversionPipeline pipeline;
    InMemoryJobStore jobs;
    LocalObjectStore store;
    PlanUsageLimits usage;
    ConversionService service;
};

QString manyLabels(int n)
{
    QString zpl;
    for (int i = 0; i < n; ++i)
        zpl += label(QStringLiteral("L%1").arg(i));
    return zpl;
}

} // namespace

TEST_CASE("a conversion runs to completion and is downloadable", "[service]")
{
    ServiceRig rig;
    const QString zpl = label(QStringLiteral("A"), 2) + label(QStringLiteral("B"))
        + label(QStringLiteral("C")) + label(QStringLiteral("D"));

    const ConversionService::StartResult started = rig.service.start(rig.request(zpl));
    REQUIRE(started.ok());
    CHECK(started.labelCount == 5);
    REQUIRE(rig.service.waitForDone(30000));

    const std::optional<ConversionJob> job = rig.service.status(started.jobId);
    REQUIRE(job);
    CHECK(job->status == ConversionJob::Completed);
    CHECK(job->progress == 100);
    CHECK(job->statusMessage() == QStringLiteral("Completed"));
    CHECK(job->pageCount == 5);
    CHECK(job->storageKey == QStringLiteral("labels/label-%1.pdf").arg(started.jobId));
    CHECK(QRegularExpression(QStringLiteral("^zplpdf_4x6_\\d{14}\\.pdf$")).match(job->fileName).hasMatch());

    // Four unique labels with a cap of two: two renderer calls
    CHECK(rig.renderer->calls().size() == 2);

    const ConversionService::DownloadInfo info = rig.service.downloadInfo(started.jobId);
    REQUIRE(info.ok());
    const QUrl url(info.url);
    CHECK(url.isLocalFile());
    const QUrlQuery query(url);
    CHECK(rig.store.verify(job->storageKey, query.queryItemValue(QStringLiteral("expires")).toLongLong(),
                           query.queryItemValue(QStringLiteral("name")),
                           query.queryItemValue(QStringLiteral("token"))));

    bool ok = false;
    const QByteArray pdf = rig.store.get(job->storageKey, &ok);
    REQUIRE(ok);
    CHECK(TestHelpers::pageFields(pdf) == QStringList({QStringLiteral("A"), QStringLiteral("A"),
                                                       QStringLiteral("B"), QStringLiteral("C"),
                                                       QStringLiteral("D")}));

    CHECK(rig.usage.usage(QStringLiteral("alice")).documents == 1);
    CHECK(rig.usage.usage(QStringLiteral("alice")).labels == 5);
    const QList<ConversionRecord> history = rig.usage.history(QStringLiteral("alice"));
    REQUIRE(history.size() == 1);
    CHECK(history.first().completed);
    CHECK(history.first().jobId == started.jobId);
}

TEST_CASE("input errors are rejected before any rendering", "[service]")
{
    ServiceRig rig;

    CHECK(rig.service.start(rig.request(QStringLiteral("   "))).error.code == ConversionError::EmptyContent);
    CHECK(rig.service.start(rig.request(QStringLiteral("hello"))).error.code == ConversionError::NoValidBlocks);
    CHECK(rig.renderer->calls().isEmpty());
}

TEST_CASE("a denied usage check returns a structured reason", "[service]")
{
    ServiceRig rig;

    SECTION("too many labels for the plan") {
        const ConversionService::StartResult r = rig.service.start(rig.request(manyLabels(101), PlanTier::Free));
        REQUIRE(r.error.code == ConversionError::LimitDenied);
        CHECK(r.error.context.value(QStringLiteral("errorCode")).toString() == QStringLiteral("LABEL_LIMIT_EXCEEDED"));
        const QJsonObject data = r.error.context.value(QStringLiteral("data")).toObject();
        CHECK(data.value(QStringLiteral("requested")).toInt() == 101);
        CHECK(data.value(QStringLiteral("allowed")).toInt() == 100);
    }

    SECTION("monthly quota used up") {
        rig.usage.setQuota(PlanTier::Free, {100, 1});
        const ConversionService::StartResult first = rig.service.start(rig.request(label(QStringLiteral("A")), PlanTier::Free));
        REQUIRE(first.ok());
        REQUIRE(rig.service.waitForDone(30000));

        const ConversionService::StartResult second = rig.service.start(rig.request(label(QStringLiteral("B")), PlanTier::Free));
        REQUIRE(second.error.code == ConversionError::LimitDenied);
        CHECK(second.error.context.value(QStringLiteral("errorCode")).toString() == QStringLiteral("MONTHLY_LIMIT_EXCEEDED"));
        const QJsonObject data = second.error.context.value(QStringLiteral("data")).toObject();
        CHECK(data.value(QStringLiteral("current")).toInt() == 1);
        CHECK(data.contains(QStringLiteral("resetsAt")));
    }

    SECTION("quantities whose sum overflows 32 bits") {
        const QString zpl = QStringLiteral("^XA^FDa^FS^PQ2000000000^XZ^XA^FDb^FS^PQ2000000000^XZ");
        const ConversionService::StartResult r = rig.service.start(rig.request(zpl, PlanTier::Free));
        REQUIRE(r.error.code == ConversionError::LimitDenied);
        CHECK(r.error.context.value(QStringLiteral("errorCode")).toString() == QStringLiteral("LABEL_LIMIT_EXCEEDED"));
        CHECK(r.jobId.isEmpty());
    }

    SECTION("images on the free plan") {
        const ConversionService::StartResult r = rig.service.start(
            rig.request(label(QStringLiteral("A")), PlanTier::Free, OutputFormat::Png));
        REQUIRE(r.error.code == ConversionError::LimitDenied);
        CHECK(r.error.context.value(QStringLiteral("errorCode")).toString() == QStringLiteral("IMAGES_NOT_ALLOWED"));
    }

    CHECK(rig.renderer->calls().size() <= 1);
}

TEST_CASE("a renderer failure fails the job", "[service]")
{
    ServiceRig rig(std::make_shared<TestHelpers::FailingRenderer>(QStringLiteral("BROKEN")));

    const ConversionService::StartResult started =
        rig.service.start(rig.request(label(QStringLiteral("ok")) + label(QStringLiteral("ok2"))
                                      + label(QStringLiteral("BROKEN"))));
    REQUIRE(started.ok());
    REQUIRE(rig.service.waitForDone(30000));

    const std::optional<ConversionJob> job = rig.service.status(started.jobId);
    REQUIRE(job);
    CHECK(job->status == ConversionJob::Failed);
    CHECK(job->error.code == ConversionError::RendererFailed);
    CHECK(job->statusMessage().startsWith(QStringLiteral("Error: ")));
    CHECK(rig.service.downloadInfo(started.jobId).error.code == ConversionError::NotReady);

    CHECK(rig.usage.usage(QStringLiteral("alice")).documents == 0);
    REQUIRE(rig.usage.history(QStringLiteral("alice")).size() == 1);
    CHECK_FALSE(rig.usage.history(QStringLiteral("alice")).first().completed);
}

TEST_CASE("unknown and unfinished jobs are reported as such", "[service]")
{
    ServiceRig rig;
    CHECK_FALSE(rig.service.status(QStringLiteral("nope")));
    CHECK(rig.service.downloadInfo(QStringLiteral("nope")).error.code == ConversionError::NotFound);

    rig.renderer->closeGate();
    const ConversionService::StartResult started = rig.service.start(rig.request(manyLabels(3)));
    REQUIRE(started.ok());
    REQUIRE(rig.renderer->waitForCalls(1));

    CHECK(rig.service.downloadInfo(started.jobId).error.code == ConversionError::NotReady);
    // The second chunk may still be on its way into the queue
    RenderDispatcher::QueuePosition pos;
    for (int i = 0; i < 100; ++i) {
        pos = rig.service.queuePosition(started.jobId);
        if (pos.state == RenderDispatcher::QueuePosition::Queued)
            break;
        QThread::msleep(20);
    }
    // First chunk is with the renderer, the second waits in line
    CHECK(pos.state == RenderDispatcher::QueuePosition::Queued);
    CHECK(pos.position == 1);

    const std::optional<ConversionJob> job = rig.service.status(started.jobId);
    REQUIRE(job);
    CHECK(job->status == ConversionJob::Processing);
    CHECK(job->statusMessage() == QStringLiteral("Processing (10%)"));

    rig.renderer->openGate();
    REQUIRE(rig.service.waitForDone(30000));
    CHECK(rig.service.status(started.jobId)->status == ConversionJob::Completed);
}

TEST_CASE("image conversions deliver a zip with one image per label", "[service]")
{
    ServiceRig rig;
    const ConversionService::StartResult started = rig.service.start(
        rig.request(label(QStringLiteral("A"), 2) + label(QStringLiteral("B")), PlanTier::Pro, OutputFormat::Jpeg));
    REQUIRE(started.ok());
    REQUIRE(rig.service.waitForDone(30000));

    const std::optional<ConversionJob> job = rig.service.status(started.jobId);
    REQUIRE(job);
    REQUIRE(job->status == ConversionJob::Completed);
    CHECK(job->fileName.endsWith(QStringLiteral(".zip")));

    const QByteArray archive = rig.store.get(job->storageKey);
    CHECK(ZipArchive::entryNames(archive) == QStringList({QStringLiteral("label_0001.jpg"),
                                                          QStringLiteral("label_0002.jpg"),
                                                          QStringLiteral("label_0003.jpg")}));
}

TEST_CASE("previews render each unique label once", "[service]")
{
    ServiceRig rig;
    const ConversionPipeline::PreviewOutput out = rig.service.previews(
        QStringLiteral("alice"), PlanTier::Free, label(QStringLiteral("A"), 4) + label(QStringLiteral("B")),
        LabelSize::TwoByOne);
    REQUIRE_FALSE(out.error.isError());
    REQUIRE(out.previews.size() == 2);
    CHECK(out.previews[0].quantity == 4);
    CHECK(out.previews[1].quantity == 1);
    CHECK_FALSE(out.previews[1].png.isEmpty());

    const BlockParser::LabelCount count = rig.service.countLabels(label(QStringLiteral("A"), 4));
    CHECK(count.totalLabels == 4);
}
