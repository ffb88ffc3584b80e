/*
 * labelsize.cpp - Label sizes accepted by the renderer
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "labelsize.h"

namespace LabelSizes {

LabelSize fromString(const QString &text)
{
    const QString t = text.trimmed().toLower();
    if (t == QLatin1String("small") || t == QLatin1String("2x1"))
        return LabelSize::TwoByOne;
    if (t == QLatin1String("2x4"))
        return LabelSize::TwoByFour;
    if (t == QLatin1String("4x2"))
        return LabelSize::FourByTwo;
    if (t == QLatin1String("large") || t == QLatin1String("4x6"))
        return LabelSize::FourBySix;
    return LabelSize::TwoByOne;
}

QString toString(LabelSize size)
{
    switch (size) {
    case LabelSize::TwoByOne:  return QStringLiteral("2x1");
    case LabelSize::TwoByFour: return QStringLiteral("2x4");
    case LabelSize::FourByTwo: return QStringLiteral("4x2");
    case LabelSize::FourBySix: return QStringLiteral("4x6");
    }
    return QStringLiteral("2x1");
}

QSizeF inches(LabelSize size)
{
    switch (size) {
    case LabelSize::TwoByOne:  return {2.0, 1.0};
    case LabelSize::TwoByFour: return {2.0, 4.0};
    case LabelSize::FourByTwo: return {4.0, 2.0};
    case LabelSize::FourBySix: return {4.0, 6.0};
    }
    return {2.0, 1.0};
}

QSizeF points(LabelSize size)
{
    return inches(size) * 72.0;
}

} // namespace LabelSizes
