#include <catch2/catch.hpp>

#include <QElapsedTimer>
#include <QThread>

#include "renderdispatcher.h"
#include "testhelpers.h"

using TestHelpers::label;
using TestHelpers::RecordingRenderer;

namespace {

RenderDispatcher::Options fastOptions(int cap = 50)
{
    RenderDispatcher::Options options;
    options.labelCap = cap;
    options.concurrency = 1;
    options.minIntervalMs = 0;
    options.estimatedSecondsPerCall = 2;
    return options;
}

QFuture<RenderResult> submit(RenderDispatcher &dispatcher, const QString &jobId, PlanTier tier,
                             const QString &field)
{
    return dispatcher.enqueue(jobId, QStringLiteral("user-") + jobId, tier, label(field),
                              LabelSize::FourBySix, 1);
}

} // namespace

TEST_CASE("higher tiers are admitted first, arrival order within a tier", "[dispatcher]")
{
    auto renderer = std::make_shared<RecordingRenderer>();
    renderer->closeGate();

    RenderDispatcher dispatcher(renderer, fastOptions());

    // Occupies the single slot while the rest queue up
    QList<QFuture<RenderResult>> futures;
    futures << submit(dispatcher, QStringLiteral("blocker"), PlanTier::Free, QStringLiteral("blocker"));
    REQUIRE(renderer->waitForCalls(1));

    futures << submit(dispatcher, QStringLiteral("f1"), PlanTier::Free, QStringLiteral("free-1"));
    futures << submit(dispatcher, QStringLiteral("p1"), PlanTier::Pro, QStringLiteral("pro-1"));
    futures << submit(dispatcher, QStringLiteral("e1"), PlanTier::Enterprise, QStringLiteral("ent-1"));
    futures << submit(dispatcher, QStringLiteral("f2"), PlanTier::Free, QStringLiteral("free-2"));
    futures << submit(dispatcher, QStringLiteral("p2"), PlanTier::Pro, QStringLiteral("pro-2"));
    futures << submit(dispatcher, QStringLiteral("m1"), PlanTier::ProMax, QStringLiteral("promax-1"));

    const RenderDispatcher::QueuePosition pos = dispatcher.queuePosition(QStringLiteral("f2"));
    CHECK(pos.state == RenderDispatcher::QueuePosition::Queued);
    CHECK(pos.position == 6);
    CHECK(pos.estimatedWaitSeconds == 12);
    CHECK(pos.queuedByTier.value(PlanTier::Free) == 2);
    CHECK(pos.queuedByTier.value(PlanTier::Pro) == 2);

    CHECK(dispatcher.queuePosition(QStringLiteral("e1")).position == 1);
    CHECK(dispatcher.queuePosition(QStringLiteral("blocker")).state
          == RenderDispatcher::QueuePosition::Processing);
    CHECK(dispatcher.queuePosition(QStringLiteral("unknown")).state
          == RenderDispatcher::QueuePosition::NotFound);

    const RenderDispatcher::QueueStats stats = dispatcher.queueStats();
    CHECK(stats.totalQueued == 6);
    CHECK(stats.inFlight == 1);
    CHECK(stats.concurrency == 1);

    renderer->openGate();
    for (QFuture<RenderResult> &f : futures)
        CHECK(f.result().ok());

    CHECK(renderer->calls() == QStringList({
        QStringLiteral("blocker"), QStringLiteral("ent-1"), QStringLiteral("promax-1"),
        QStringLiteral("pro-1"), QStringLiteral("pro-2"), QStringLiteral("free-1"),
        QStringLiteral("free-2")}));
}

TEST_CASE("two workers never exceed the ceiling and still admit by priority", "[dispatcher]")
{
    auto renderer = std::make_shared<RecordingRenderer>();
    renderer->closeGate();

    RenderDispatcher::Options options = fastOptions();
    options.concurrency = 2;
    RenderDispatcher dispatcher(renderer, options);

    QList<QFuture<RenderResult>> futures;
    futures << submit(dispatcher, QStringLiteral("b1"), PlanTier::Free, QStringLiteral("blocker-1"));
    futures << submit(dispatcher, QStringLiteral("b2"), PlanTier::Free, QStringLiteral("blocker-2"));
    REQUIRE(renderer->waitForCalls(2));

    futures << submit(dispatcher, QStringLiteral("f1"), PlanTier::Free, QStringLiteral("free-1"));
    futures << submit(dispatcher, QStringLiteral("p1"), PlanTier::Pro, QStringLiteral("pro-1"));
    futures << submit(dispatcher, QStringLiteral("e1"), PlanTier::Enterprise, QStringLiteral("ent-1"));
    futures << submit(dispatcher, QStringLiteral("m1"), PlanTier::ProMax, QStringLiteral("promax-1"));
    futures << submit(dispatcher, QStringLiteral("p2"), PlanTier::Pro, QStringLiteral("pro-2"));

    QThread::msleep(100);
    const RenderDispatcher::QueueStats stats = dispatcher.queueStats();
    CHECK(stats.inFlight == 2);
    CHECK(stats.totalQueued == 5);
    CHECK(stats.concurrency == 2);
    CHECK(renderer->calls().size() == 2);
    CHECK(dispatcher.queuePosition(QStringLiteral("m1")).estimatedWaitSeconds == 2);
    CHECK(dispatcher.queuePosition(QStringLiteral("f1")).estimatedWaitSeconds == 6);

    // Free one slot at a time so each admission is observable
    const QStringList expected({QStringLiteral("ent-1"), QStringLiteral("promax-1"),
                                QStringLiteral("pro-1"), QStringLiteral("pro-2"),
                                QStringLiteral("free-1")});
    for (int i = 0; i < expected.size(); ++i) {
        renderer->letThrough(1);
        REQUIRE(renderer->waitForCalls(3 + i));
        QThread::msleep(20);
        CHECK(renderer->calls().size() == 3 + i);
        CHECK(renderer->calls().at(2 + i) == expected.at(i));
        CHECK(dispatcher.queueStats().inFlight <= 2);
    }

    renderer->openGate();
    for (QFuture<RenderResult> &f : futures)
        CHECK(f.result().ok());
    CHECK(renderer->calls().size() == 7);
}

TEST_CASE("payloads over the cap never reach the renderer", "[dispatcher]")
{
    auto renderer = std::make_shared<RecordingRenderer>(100);
    RenderDispatcher dispatcher(renderer, fastOptions(3));

    QString payload;
    for (int i = 0; i < 4; ++i)
        payload += label(QString::number(i)) + QLatin1Char('\n');

    // The declared count is wrong on purpose; the payload itself decides
    QFuture<RenderResult> f = dispatcher.enqueue(QStringLiteral("big"), QStringLiteral("u"),
                                                 PlanTier::Pro, payload, LabelSize::TwoByOne, 2);
    const RenderResult result = f.result();
    CHECK(result.status == RenderResult::PayloadTooLarge);
    CHECK(renderer->calls().isEmpty());
}

TEST_CASE("renderer failures are reported without retry", "[dispatcher]")
{
    auto renderer = std::make_shared<TestHelpers::FailingRenderer>(QStringLiteral("BROKEN"));
    RenderDispatcher dispatcher(renderer, fastOptions());

    const RenderResult result = submit(dispatcher, QStringLiteral("j"), PlanTier::Enterprise,
                                       QStringLiteral("BROKEN")).result();
    CHECK(result.status == RenderResult::Transient);
    CHECK(renderer->calls().size() == 1);

    const RendererStats::Summary stats = dispatcher.stats();
    CHECK(stats.totalCalls == 1);
    CHECK(stats.errorRate == Approx(100.0));
}

TEST_CASE("successful calls produce one page per label", "[dispatcher]")
{
    auto renderer = std::make_shared<RecordingRenderer>();
    RenderDispatcher dispatcher(renderer, fastOptions());

    const QString payload = label(QStringLiteral("one")) + QLatin1Char('\n') + label(QStringLiteral("two"));
    const RenderResult result = dispatcher.enqueue(QStringLiteral("j"), QStringLiteral("u"),
                                                   PlanTier::Free, payload, LabelSize::TwoByOne, 2)
                                    .result();
    REQUIRE(result.ok());
    CHECK(TestHelpers::pageFields(result.pdf) == QStringList({QStringLiteral("one"), QStringLiteral("two")}));
    CHECK(dispatcher.stats().totalLabelsRendered == 2);
}

TEST_CASE("pending calls fail with Shutdown when the dispatcher goes away", "[dispatcher]")
{
    auto renderer = std::make_shared<RecordingRenderer>();
    renderer->closeGate();

    QFuture<RenderResult> running;
    QFuture<RenderResult> waiting;
    // Opens the gate only once the destructor below is already waiting
    std::unique_ptr<QThread> opener(QThread::create([renderer] {
        QThread::msleep(200);
        renderer->openGate();
    }));
    {
        RenderDispatcher dispatcher(renderer, fastOptions());
        running = submit(dispatcher, QStringLiteral("a"), PlanTier::Free, QStringLiteral("a"));
        REQUIRE(renderer->waitForCalls(1));
        waiting = submit(dispatcher, QStringLiteral("b"), PlanTier::Free, QStringLiteral("b"));
        opener->start();
    }
    opener->wait();

    CHECK(running.result().ok());
    CHECK(waiting.result().status == RenderResult::Shutdown);
}

TEST_CASE("admissions are spaced by the minimum interval", "[dispatcher]")
{
    auto renderer = std::make_shared<RecordingRenderer>();
    RenderDispatcher::Options options = fastOptions();
    options.minIntervalMs = 150;
    RenderDispatcher dispatcher(renderer, options);

    QElapsedTimer timer;
    timer.start();
    QFuture<RenderResult> a = submit(dispatcher, QStringLiteral("a"), PlanTier::Free, QStringLiteral("a"));
    QFuture<RenderResult> b = submit(dispatcher, QStringLiteral("b"), PlanTier::Free, QStringLiteral("b"));
    QFuture<RenderResult> c = submit(dispatcher, QStringLiteral("c"), PlanTier::Free, QStringLiteral("c"));
    CHECK(a.result().ok());
    CHECK(b.result().ok());
    CHECK(c.result().ok());
    CHECK(timer.elapsed() >= 300);
}
