/*
 * documentreconstructor.cpp - Rebuild the output PDF from per-chunk renders
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "documentreconstructor.h"
#include "mupdfcontext.h"

#include <QDebug>
#include <QtConcurrent/QtConcurrentMap>

#include <mupdf/pdf.h>

#include <algorithm>
#include <vector>

namespace {

struct LoadedChunk {
    int index = 0;
    QByteArray data;
    pdf_document *doc = nullptr;
    int pageCount = 0;
};

// Where one occurrence comes from and where it goes
struct Placement {
    int localPage = 0;
    int outputPos = 0;
};

struct CopiedPage {
    int outputPos = 0;
    pdf_obj *ref = nullptr;
};

void loadChunk(const MuPdfContext &base, LoadedChunk &chunk)
{
    if (chunk.data.isEmpty())
        return;

    MuPdfContext::Clone clone(base);
    fz_context *ctx = clone.get();
    if (!ctx)
        return;

    fz_buffer *buf = nullptr;
    fz_stream *stm = nullptr;
    fz_var(buf);
    fz_var(stm);

    fz_try(ctx) {
        buf = fz_new_buffer_from_copied_data(
            ctx, reinterpret_cast<const unsigned char *>(chunk.data.constData()),
            static_cast<size_t>(chunk.data.size()));
        stm = fz_open_buffer(ctx, buf);
        chunk.doc = pdf_open_document_with_stream(ctx, stm);
        chunk.pageCount = pdf_count_pages(ctx, chunk.doc);
        if (chunk.pageCount <= 0)
            fz_throw(ctx, FZ_ERROR_GENERIC, "document has no pages");
    }
    fz_always(ctx) {
        fz_drop_stream(ctx, stm);
        fz_drop_buffer(ctx, buf);
    }
    fz_catch(ctx) {
        qWarning() << "DocumentReconstructor: chunk" << chunk.index
                   << "failed to load:" << fz_caught_message(ctx);
        if (chunk.doc) {
            pdf_drop_document(ctx, chunk.doc);
            chunk.doc = nullptr;
        }
        chunk.pageCount = 0;
    }
}

// Copies one page into dst as a new page object that is not yet part of
// the page tree. The content stream is duplicated for every call; fonts,
// images and boxes go through the chunk's graft map and are shared.
pdf_obj *copyPage(fz_context *ctx, pdf_graft_map *map, pdf_document *dst,
                  pdf_document *src, int pageIndex)
{
    static pdf_obj *const sharedKeys[] = {
        PDF_NAME(Resources), PDF_NAME(MediaBox), PDF_NAME(CropBox),
        PDF_NAME(BleedBox), PDF_NAME(TrimBox), PDF_NAME(ArtBox),
        PDF_NAME(Rotate), PDF_NAME(UserUnit),
    };

    pdf_obj *pageObj = pdf_lookup_page_obj(ctx, src, pageIndex);
    pdf_flatten_inheritable_page_items(ctx, pageObj);

    pdf_obj *dict = pdf_new_dict(ctx, dst, 8);
    pdf_obj *ref = nullptr;
    fz_var(ref);

    fz_try(ctx) {
        pdf_dict_put(ctx, dict, PDF_NAME(Type), PDF_NAME(Page));
        pdf_obj *contents = pdf_dict_get(ctx, pageObj, PDF_NAME(Contents));
        if (contents)
            pdf_dict_put_drop(ctx, dict, PDF_NAME(Contents), pdf_graft_object(ctx, dst, contents));
        for (pdf_obj *key : sharedKeys) {
            pdf_obj *value = pdf_dict_get(ctx, pageObj, key);
            if (value)
                pdf_dict_put_drop(ctx, dict, key, pdf_graft_mapped_object(ctx, map, value));
        }
        ref = pdf_add_object(ctx, dst, dict);
    }
    fz_always(ctx) {
        pdf_drop_obj(ctx, dict);
    }
    fz_catch(ctx) {
        fz_rethrow(ctx);
    }
    return ref;
}

QByteArray saveDocument(fz_context *ctx, pdf_document *doc, bool &ok)
{
    QByteArray bytes;
    fz_buffer *buf = nullptr;
    fz_output *output = nullptr;
    fz_var(buf);
    fz_var(output);
    ok = false;

    fz_try(ctx) {
        buf = fz_new_buffer(ctx, 64 * 1024);
        output = fz_new_output_with_buffer(ctx, buf);
        pdf_write_options opts = pdf_default_write_options;
        opts.do_compress = 1;
        opts.do_garbage = 1;
        pdf_write_document(ctx, doc, output, &opts);
        fz_close_output(ctx, output);

        unsigned char *data = nullptr;
        size_t len = fz_buffer_storage(ctx, buf, &data);
        bytes = QByteArray(reinterpret_cast<const char *>(data), static_cast<qsizetype>(len));
        ok = true;
    }
    fz_always(ctx) {
        fz_drop_output(ctx, output);
        fz_drop_buffer(ctx, buf);
    }
    fz_catch(ctx) {
        qWarning() << "DocumentReconstructor: failed to write output:" << fz_caught_message(ctx);
    }
    return bytes;
}

} // namespace

ReconstructResult DocumentReconstructor::reconstruct(
    const QList<QByteArray> &chunkPdfs,
    const QList<ChunkPlanner::ChunkRange> &chunks,
    const BlockParser::ExpansionSequence &sequence) const
{
    ReconstructResult result;
    if (chunkPdfs.isEmpty() || chunks.isEmpty() || sequence.isEmpty()) {
        result.error = ConversionError::make(ConversionError::EmptyDocument,
                                             QStringLiteral("No chunk documents to merge"));
        return result;
    }

    MuPdfContext base;
    if (!base.isValid()) {
        result.error = ConversionError::make(ConversionError::EmptyDocument,
                                             QStringLiteral("PDF engine unavailable"));
        return result;
    }
    fz_context *ctx = base.get();

    // 1. Load every chunk document once, in parallel
    QList<LoadedChunk> loaded(chunkPdfs.size());
    for (int i = 0; i < chunkPdfs.size(); ++i) {
        loaded[i].index = i;
        loaded[i].data = chunkPdfs[i];
    }
    QtConcurrent::blockingMap(loaded, [&base](LoadedChunk &chunk) { loadChunk(base, chunk); });

    // 2. Group the sequence by source chunk
    QList<QList<Placement>> placements(chunks.size());
    for (int pos = 0; pos < sequence.size(); ++pos) {
        const int unique = sequence[pos];
        const int c = ChunkPlanner::chunkOf(chunks, unique);
        if (c < 0 || c >= loaded.size()) {
            qWarning() << "DocumentReconstructor: sequence entry" << pos
                       << "points at unknown block" << unique;
            result.skippedPages++;
            continue;
        }
        placements[c].append({unique - chunks[c].start, pos});
    }

    pdf_document *out = nullptr;
    fz_var(out);
    fz_try(ctx) {
        out = pdf_create_document(ctx);
    }
    fz_catch(ctx) {
        qWarning() << "DocumentReconstructor: cannot create output:" << fz_caught_message(ctx);
    }

    std::vector<CopiedPage> copied;
    copied.reserve(static_cast<size_t>(sequence.size()));

    // 3. One batched copy per chunk
    for (int c = 0; out && c < placements.size(); ++c) {
        const QList<Placement> &wanted = placements[c];
        if (wanted.isEmpty())
            continue;

        const LoadedChunk &chunk = loaded[c];
        if (!chunk.doc) {
            qWarning() << "DocumentReconstructor: chunk" << c << "unavailable, skipping"
                       << wanted.size() << "page(s)";
            result.unavailableChunks.append(c);
            result.skippedPages += wanted.size();
            continue;
        }

        pdf_graft_map *map = nullptr;
        fz_var(map);
        fz_try(ctx) {
            map = pdf_new_graft_map(ctx, out);
        }
        fz_catch(ctx) {
            qWarning() << "DocumentReconstructor: graft map for chunk" << c
                       << "failed:" << fz_caught_message(ctx);
        }
        if (!map) {
            result.unavailableChunks.append(c);
            result.skippedPages += wanted.size();
            continue;
        }

        int chunkSkipped = 0;
        for (const Placement &p : wanted) {
            if (p.localPage >= chunk.pageCount) {
                ++chunkSkipped;
                continue;
            }
            pdf_obj *ref = nullptr;
            fz_try(ctx) {
                ref = copyPage(ctx, map, out, chunk.doc, p.localPage);
            }
            fz_catch(ctx) {
                qWarning() << "DocumentReconstructor: copy of page" << p.localPage
                           << "from chunk" << c << "failed:" << fz_caught_message(ctx);
                ref = nullptr;
            }
            if (ref)
                copied.push_back({p.outputPos, ref});
            else
                ++chunkSkipped;
        }
        pdf_drop_graft_map(ctx, map);

        if (chunkSkipped > 0) {
            qWarning() << "DocumentReconstructor: chunk" << c << "supplied"
                       << (wanted.size() - chunkSkipped) << "of" << wanted.size() << "page(s)";
            result.skippedPages += chunkSkipped;
        }
    }

    // 4. Append in output order
    std::sort(copied.begin(), copied.end(),
              [](const CopiedPage &a, const CopiedPage &b) { return a.outputPos < b.outputPos; });

    int inserted = 0;
    for (const CopiedPage &page : copied) {
        bool ok = false;
        fz_try(ctx) {
            pdf_insert_page(ctx, out, -1, page.ref);
            ok = true;
        }
        fz_catch(ctx) {
            qWarning() << "DocumentReconstructor: insert at" << page.outputPos
                       << "failed:" << fz_caught_message(ctx);
        }
        pdf_drop_obj(ctx, page.ref);
        if (ok)
            ++inserted;
        else
            result.skippedPages++;
    }

    for (LoadedChunk &chunk : loaded) {
        if (chunk.doc)
            pdf_drop_document(ctx, chunk.doc);
        chunk.doc = nullptr;
    }

    if (result.skippedPages > 0)
        qWarning() << "DocumentReconstructor: omitted" << result.skippedPages << "page(s) of"
                   << sequence.size();

    if (inserted == 0) {
        if (out)
            pdf_drop_document(ctx, out);
        result.error = ConversionError::make(
            ConversionError::EmptyDocument,
            QStringLiteral("Reconstructed document is empty"),
            QJsonObject{{QStringLiteral("skippedPages"), result.skippedPages}});
        return result;
    }

    bool saved = false;
    result.pdf = saveDocument(ctx, out, saved);
    pdf_drop_document(ctx, out);
    if (!saved || result.pdf.isEmpty()) {
        result.pdf.clear();
        result.error = ConversionError::make(ConversionError::EmptyDocument,
                                             QStringLiteral("Reconstructed document could not be written"));
        return result;
    }

    result.pageCount = inserted;
    return result;
}
