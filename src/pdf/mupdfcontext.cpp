/*
 * mupdfcontext.cpp - Thread-aware MuPDF context
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "mupdfcontext.h"

#include <QDebug>

MuPdfContext::MuPdfContext()
{
    m_lockContext.user = this;
    m_lockContext.lock = &MuPdfContext::lock;
    m_lockContext.unlock = &MuPdfContext::unlock;

    m_ctx = fz_new_context(nullptr, &m_lockContext, FZ_STORE_DEFAULT);
    if (!m_ctx)
        qWarning() << "MuPdfContext: failed to create MuPDF context";
}

MuPdfContext::~MuPdfContext()
{
    if (m_ctx)
        fz_drop_context(m_ctx);
}

void MuPdfContext::lock(void *user, int lock)
{
    static_cast<MuPdfContext *>(user)->m_locks[lock].lock();
}

void MuPdfContext::unlock(void *user, int lock)
{
    static_cast<MuPdfContext *>(user)->m_locks[lock].unlock();
}

MuPdfContext::Clone::Clone(const MuPdfContext &base)
{
    if (base.m_ctx)
        m_ctx = fz_clone_context(base.m_ctx);
    if (!m_ctx)
        qWarning() << "MuPdfContext: failed to clone MuPDF context";
}

MuPdfContext::Clone::~Clone()
{
    if (m_ctx)
        fz_drop_context(m_ctx);
}
