#include <catch2/catch.hpp>

#include "ziparchive.h"

TEST_CASE("archives keep entry order and contents", "[zip]")
{
    ZipArchive zip;
    zip.addFile(QStringLiteral("b.txt"), QByteArray("second"));
    zip.addFile(QStringLiteral("a/nested.txt"), QByteArray(4096, 'x'));
    zip.addFile(QStringLiteral("b.txt"), QByteArray("replaced"));
    CHECK(zip.entryCount() == 2);

    const ZipArchive::Result built = zip.build();
    REQUIRE(built.valid);
    CHECK(built.data.startsWith("PK"));
    CHECK(ZipArchive::entryNames(built.data)
          == QStringList({QStringLiteral("b.txt"), QStringLiteral("a/nested.txt")}));
    CHECK(ZipArchive::readEntry(built.data, QStringLiteral("b.txt")) == QByteArray("replaced"));
    CHECK(ZipArchive::readEntry(built.data, QStringLiteral("a/nested.txt")).size() == 4096);
}

TEST_CASE("reading garbage yields nothing", "[zip]")
{
    CHECK(ZipArchive::entryNames(QByteArray("not a zip")).isEmpty());
    CHECK(ZipArchive::readEntry(QByteArray("not a zip"), QStringLiteral("x")).isEmpty());
}
