#include <catch2/catch.hpp>

#include <QFile>
#include <QTemporaryDir>

#include "settings.h"

TEST_CASE("settings fall back to defaults", "[settings]")
{
    QTemporaryDir dir;
    const Settings s = Settings::load(dir.filePath(QStringLiteral("missingrc")));

    CHECK(s.dispatcher.labelCap == 50);
    CHECK(s.images.dpi == 203);
    CHECK(s.signedUrlTtlSeconds == 900);
    CHECK_FALSE(s.offline);
    CHECK(s.batch.limits.value(PlanTier::Enterprise).maxFiles == 50);
    CHECK(s.quotas.value(PlanTier::Free).documentsPerMonth == 25);
}

TEST_CASE("settings read every group", "[settings]")
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("zplforgerc"));
    QFile rc(path);
    REQUIRE(rc.open(QIODevice::WriteOnly | QIODevice::Text));
    rc.write("[Renderer]\n"
             "LabelCap=20\n"
             "MinIntervalMs=0\n"
             "Offline=true\n"
             "[Export]\n"
             "JpegQuality=70\n"
             "[Storage]\n"
             "Root=/tmp/zplforge-test\n"
             "SigningKey=secret\n"
             "[Batch]\n"
             "MaxConcurrentFiles=3\n"
             "ProMaxMaxFiles=12\n"
             "[Limits]\n"
             "FreeDocumentsPerMonth=3\n"
             "ProMaxLabelsPerDocument=2000\n");
    rc.close();

    const Settings s = Settings::load(path);
    CHECK(s.dispatcher.labelCap == 20);
    CHECK(s.dispatcher.minIntervalMs == 0);
    CHECK(s.offline);
    CHECK(s.images.jpegQuality == 70);
    CHECK(s.storageRoot == QStringLiteral("/tmp/zplforge-test"));
    CHECK(s.signingKey == QByteArray("secret"));
    CHECK(s.batch.maxConcurrentFiles == 3);
    CHECK(s.batch.limits.value(PlanTier::ProMax).maxFiles == 12);
    CHECK(s.batch.limits.value(PlanTier::Pro).maxFiles == 10);
    CHECK(s.quotas.value(PlanTier::Free).documentsPerMonth == 3);
    CHECK(s.quotas.value(PlanTier::ProMax).labelsPerDocument == 2000);
}
