/*
 * mupdfcontext.h - Thread-aware MuPDF context
 *
 * MuPDF contexts are single-threaded. A context created here carries a lock
 * table so that clones can be handed to worker threads; documents opened in
 * a clone may afterwards be used through the base context, as long as no
 * two threads touch the same document at once.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_MUPDFCONTEXT_H
#define ZPLFORGE_MUPDFCONTEXT_H

#include <QMutex>

#include <array>

#include <mupdf/fitz.h>

class MuPdfContext
{
public:
    MuPdfContext();
    ~MuPdfContext();

    MuPdfContext(const MuPdfContext &) = delete;
    MuPdfContext &operator=(const MuPdfContext &) = delete;

    bool isValid() const { return m_ctx != nullptr; }
    fz_context *get() const { return m_ctx; }

    // Context for one worker thread, dropped when the object goes away
    class Clone {
    public:
        explicit Clone(const MuPdfContext &base);
        ~Clone();
        Clone(const Clone &) = delete;
        Clone &operator=(const Clone &) = delete;

        bool isValid() const { return m_ctx != nullptr; }
        fz_context *get() const { return m_ctx; }

    private:
        fz_context *m_ctx = nullptr;
    };

private:
    static void lock(void *user, int lock);
    static void unlock(void *user, int lock);

    std::array<QMutex, FZ_LOCK_MAX> m_locks;
    fz_locks_context m_lockContext;
    fz_context *m_ctx = nullptr;
};

#endif // ZPLFORGE_MUPDFCONTEXT_H
