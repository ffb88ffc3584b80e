#include <catch2/catch.hpp>

#include <QFile>
#include <QTemporaryDir>
#include <QUrl>
#include <QUrlQuery>

#include "jobstore.h"
#include "localobjectstore.h"
#include "planusagelimits.h"
#include "rendererstats.h"

TEST_CASE("local object store round trip and signing", "[storage]")
{
    QTemporaryDir dir;
    LocalObjectStore store(dir.path(), QByteArray("key"), 60);

    QString error;
    REQUIRE(store.put(QStringLiteral("labels/a.pdf"), QByteArray("data"), QStringLiteral("application/pdf"), &error));
    bool ok = false;
    CHECK(store.get(QStringLiteral("labels/a.pdf"), &ok) == QByteArray("data"));
    CHECK(ok);

    const ObjectStore::SignedUrl signedUrl = store.sign(QStringLiteral("labels/a.pdf"), QStringLiteral("out.pdf"));
    REQUIRE(signedUrl.isValid());
    const QUrlQuery query{QUrl(signedUrl.url)};
    const qint64 expires = query.queryItemValue(QStringLiteral("expires")).toLongLong();
    const QString token = query.queryItemValue(QStringLiteral("token"));
    CHECK(expires == signedUrl.expiresAt.toSecsSinceEpoch());
    CHECK(store.verify(QStringLiteral("labels/a.pdf"), expires, QStringLiteral("out.pdf"), token));
    CHECK_FALSE(store.verify(QStringLiteral("labels/a.pdf"), expires, QStringLiteral("other.pdf"), token));
    CHECK_FALSE(store.verify(QStringLiteral("labels/a.pdf"), expires, QStringLiteral("out.pdf"), token,
                             signedUrl.expiresAt.addSecs(1)));

    CHECK(store.remove(QStringLiteral("labels/a.pdf")));
    CHECK_FALSE(store.remove(QStringLiteral("labels/a.pdf")));
    CHECK_FALSE(store.sign(QStringLiteral("labels/a.pdf"), QStringLiteral("out.pdf")).isValid());
}

TEST_CASE("storage keys cannot escape the root", "[storage]")
{
    QTemporaryDir dir;
    LocalObjectStore store(dir.path() + QStringLiteral("/root"), QByteArray("key"));
    QString error;
    CHECK_FALSE(store.put(QStringLiteral("../outside"), QByteArray("x"), QString(), &error));
    CHECK_FALSE(error.isEmpty());
    CHECK_FALSE(store.put(QStringLiteral("/etc/passwd"), QByteArray("x"), QString()));
    CHECK_FALSE(QFile::exists(dir.path() + QStringLiteral("/outside")));
}

TEST_CASE("plan usage limits", "[usage]")
{
    PlanUsageLimits limits;

    CHECK(limits.canConvert(QStringLiteral("u"), PlanTier::Free, 100, OutputFormat::Pdf).allowed);
    const UsageDecision tooMany = limits.canConvert(QStringLiteral("u"), PlanTier::Free, 101, OutputFormat::Pdf);
    CHECK_FALSE(tooMany.allowed);
    CHECK(tooMany.errorCode == QStringLiteral("LABEL_LIMIT_EXCEEDED"));
    CHECK(limits.canConvert(QStringLiteral("u"), PlanTier::Enterprise, 5000, OutputFormat::Pdf).allowed);

    limits.setQuota(PlanTier::Pro, {500, 2});
    ConversionRecord record;
    record.userId = QStringLiteral("u");
    record.labelCount = 7;
    record.completed = true;
    REQUIRE(limits.recordConversion(record));
    record.completed = false;
    REQUIRE(limits.recordConversion(record));
    CHECK(limits.usage(QStringLiteral("u")).documents == 1);
    CHECK(limits.canConvert(QStringLiteral("u"), PlanTier::Pro, 1, OutputFormat::Pdf).allowed);

    record.completed = true;
    REQUIRE(limits.recordConversion(record));
    const UsageDecision monthly = limits.canConvert(QStringLiteral("u"), PlanTier::Pro, 1, OutputFormat::Pdf);
    CHECK_FALSE(monthly.allowed);
    CHECK(monthly.errorCode == QStringLiteral("MONTHLY_LIMIT_EXCEEDED"));
    CHECK(monthly.data.value(QStringLiteral("current")).toInt() == 2);
    CHECK(limits.history(QStringLiteral("u")).size() == 3);

    QString error;
    CHECK_FALSE(limits.recordConversion(ConversionRecord(), &error));
}

TEST_CASE("job store updates are visible to readers", "[jobs]")
{
    InMemoryJobStore store;
    ConversionJob job;
    job.id = QStringLiteral("j");
    store.putJob(job);

    CHECK(store.updateJob(QStringLiteral("j"), [](ConversionJob &j) { j.progress = 40; }));
    CHECK(store.job(QStringLiteral("j"))->progress == 40);
    CHECK(store.job(QStringLiteral("j"))->updatedAt.isValid());
    CHECK_FALSE(store.updateJob(QStringLiteral("missing"), [](ConversionJob &) {}));
    CHECK_FALSE(store.batch(QStringLiteral("j")).has_value());
}

TEST_CASE("renderer statistics per hour", "[stats]")
{
    RendererStats stats(24);
    const QDateTime t0(QDate(2026, 10, 19), QTime(14, 5), Qt::UTC);

    RenderResult ok;
    ok.responseTimeMs = 100;
    RenderResult limited;
    limited.status = RenderResult::Transient;
    limited.httpStatus = 429;
    limited.responseTimeMs = 10;
    RenderResult tooLarge;
    tooLarge.status = RenderResult::PayloadTooLarge;
    tooLarge.httpStatus = 413;
    tooLarge.responseTimeMs = 30;

    stats.record(ok, 50, t0);
    stats.record(limited, 50, t0.addSecs(60));
    stats.record(ok, 20, t0.addSecs(3600));
    stats.record(tooLarge, 60, t0.addSecs(3700));
    stats.record(ok, 5, t0.addSecs(3800));

    const QList<RendererStats::Bucket> buckets = stats.buckets();
    REQUIRE(buckets.size() == 2);
    CHECK(buckets[0].hourKey == QStringLiteral("2026-10-19T14"));
    CHECK(buckets[0].rateLimitHits == 1);
    CHECK(buckets[0].minResponseTimeMs == 10);
    CHECK(buckets[0].maxResponseTimeMs == 100);
    CHECK(buckets[1].payloadTooLargeHits == 1);
    CHECK(buckets[1].labelCount == 25);

    const RendererStats::Summary summary = stats.summary();
    CHECK(summary.totalCalls == 5);
    CHECK(summary.totalLabelsRendered == 75);
    CHECK(summary.peakHour == QStringLiteral("2026-10-19T15"));
    CHECK(summary.errorRate == Approx(40.0));
    CHECK(summary.rateLimitRate == Approx(20.0));

    // Old hours fall out of the window
    stats.record(ok, 1, t0.addSecs(3600 * 30));
    CHECK(stats.buckets().size() == 1);
}
