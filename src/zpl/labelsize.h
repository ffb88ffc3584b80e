/*
 * labelsize.h - Label sizes accepted by the renderer
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_LABELSIZE_H
#define ZPLFORGE_LABELSIZE_H

#include <QSizeF>
#include <QString>

enum class LabelSize {
    TwoByOne,
    TwoByFour,
    FourByTwo,
    FourBySix,
};

namespace LabelSizes {

// Accepts "2x1", "2x4", "4x2", "4x6" plus the aliases "small" and "large".
// Anything else resolves to 2x1.
LabelSize fromString(const QString &text);

// Renderer path component, e.g. "4x6"
QString toString(LabelSize size);

// Width and height in inches
QSizeF inches(LabelSize size);

// Page size in PDF points (72 per inch)
QSizeF points(LabelSize size);

} // namespace LabelSizes

#endif // ZPLFORGE_LABELSIZE_H
