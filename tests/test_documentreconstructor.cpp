#include <catch2/catch.hpp>

#include "blockparser.h"
#include "chunkplanner.h"
#include "documentreconstructor.h"
#include "placeholderrenderer.h"
#include "testhelpers.h"

using TestHelpers::label;

namespace {

struct Fixture {
    BlockParser::DedupResult dedup;
    QList<ChunkPlanner::ChunkRange> chunks;
    QList<QByteArray> chunkPdfs;
};

Fixture render(const QString &zpl, int cap)
{
    Fixture f;
    f.dedup = BlockParser::deduplicate(BlockParser::parse(zpl).blocks);
    f.chunks = ChunkPlanner::plan(f.dedup.uniqueBlocks.size(), cap);

    PlaceholderRenderer renderer(cap);
    for (const ChunkPlanner::ChunkRange &c : f.chunks) {
        const RenderResult r = renderer.render(
            BlockParser::joinPayload(f.dedup.uniqueBlocks, c.start, c.end), LabelSize::FourBySix);
        f.chunkPdfs << r.pdf;
    }
    return f;
}

QStringList expectedFields(const Fixture &f)
{
    QStringList fields;
    for (int idx : f.dedup.sequence)
        fields << TestHelpers::fieldsOf(f.dedup.uniqueBlocks[idx].content).value(0);
    return fields;
}

} // namespace

TEST_CASE("pages follow the expansion sequence across chunk boundaries", "[reconstruct]")
{
    const QString zpl = label(QStringLiteral("A")) + label(QStringLiteral("B"), 2)
        + label(QStringLiteral("C")) + label(QStringLiteral("A"), 2) + label(QStringLiteral("D"))
        + label(QStringLiteral("B"));
    const Fixture f = render(zpl, 2);
    REQUIRE(f.chunks.size() == 2);

    const ReconstructResult result = DocumentReconstructor().reconstruct(f.chunkPdfs, f.chunks,
                                                                         f.dedup.sequence);
    REQUIRE(result.ok());
    CHECK(result.pageCount == f.dedup.sequence.size());
    CHECK(result.skippedPages == 0);
    CHECK(result.unavailableChunks.isEmpty());

    const QStringList fields = TestHelpers::pageFields(result.pdf);
    CHECK(fields == expectedFields(f));
    CHECK(fields == QStringList({QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("B"),
                                 QStringLiteral("C"), QStringLiteral("A"), QStringLiteral("A"),
                                 QStringLiteral("D"), QStringLiteral("B")}));
}

TEST_CASE("120 identical labels become 120 pages from one render", "[reconstruct]")
{
    QString zpl;
    for (int i = 0; i < 120; ++i)
        zpl += label(QStringLiteral("SAME"));
    const Fixture f = render(zpl, 50);
    REQUIRE(f.chunks.size() == 1);

    const ReconstructResult result = DocumentReconstructor().reconstruct(f.chunkPdfs, f.chunks,
                                                                         f.dedup.sequence);
    REQUIRE(result.ok());
    CHECK(result.pageCount == 120);

    const QStringList fields = TestHelpers::pageFields(result.pdf);
    REQUIRE(fields.size() == 120);
    CHECK(fields.count(QStringLiteral("SAME")) == 120);
}

TEST_CASE("an unreadable chunk is skipped and the rest kept", "[reconstruct]")
{
    const QString zpl = label(QStringLiteral("A")) + label(QStringLiteral("B"))
        + label(QStringLiteral("C"), 3) + label(QStringLiteral("A"));
    Fixture f = render(zpl, 2);
    REQUIRE(f.chunks.size() == 2);
    f.chunkPdfs[1] = QByteArray("%PDF-1.4 this is not a document");

    const ReconstructResult result = DocumentReconstructor().reconstruct(f.chunkPdfs, f.chunks,
                                                                         f.dedup.sequence);
    REQUIRE(result.ok());
    CHECK(result.unavailableChunks == QList<int>{1});
    CHECK(result.skippedPages == 3);
    CHECK(result.pageCount == f.dedup.sequence.size() - 3);
    CHECK(TestHelpers::pageFields(result.pdf)
          == QStringList({QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("A")}));
}

TEST_CASE("missing pages inside a chunk are skipped", "[reconstruct]")
{
    Fixture f = render(label(QStringLiteral("A")) + label(QStringLiteral("B")), 50);
    PlaceholderRenderer renderer;
    f.chunkPdfs[0] = renderer.render(label(QStringLiteral("A")), LabelSize::FourBySix).pdf;

    const ReconstructResult result = DocumentReconstructor().reconstruct(f.chunkPdfs, f.chunks,
                                                                         f.dedup.sequence);
    REQUIRE(result.ok());
    CHECK(result.pageCount == 1);
    CHECK(result.skippedPages == 1);
}

TEST_CASE("nothing to assemble is an EmptyDocument error", "[reconstruct]")
{
    Fixture f = render(label(QStringLiteral("A")) + label(QStringLiteral("B")), 1);
    for (QByteArray &pdf : f.chunkPdfs)
        pdf.clear();

    const ReconstructResult result = DocumentReconstructor().reconstruct(f.chunkPdfs, f.chunks,
                                                                         f.dedup.sequence);
    CHECK_FALSE(result.ok());
    CHECK(result.error.code == ConversionError::EmptyDocument);
    CHECK(result.pdf.isEmpty());
    CHECK(result.unavailableChunks == QList<int>({0, 1}));
}

TEST_CASE("reconstruction is deterministic", "[reconstruct]")
{
    const Fixture f = render(label(QStringLiteral("X"), 2) + label(QStringLiteral("Y")), 1);
    DocumentReconstructor reconstructor;
    const ReconstructResult first = reconstructor.reconstruct(f.chunkPdfs, f.chunks, f.dedup.sequence);
    const ReconstructResult second = reconstructor.reconstruct(f.chunkPdfs, f.chunks, f.dedup.sequence);
    REQUIRE(first.ok());
    REQUIRE(second.ok());
    CHECK(TestHelpers::pageFields(first.pdf) == TestHelpers::pageFields(second.pdf));
    CHECK(first.pageCount == 3);
}
