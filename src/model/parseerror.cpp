/*
 * parseerror.cpp — Typed failure for source loading and segmentation
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "parseerror.h"

#include <KLocalizedString>

QString ParseError::message() const
{
    const QString where = path.isEmpty() ? i18n("pasted text") : path;
    switch (reason) {
    case UnsupportedFormat:
        return i18n("Unsupported file format: %1", where);
    case MalformedContent:
        if (detail.isEmpty())
            return i18n("Malformed content in %1", where);
        return i18n("Malformed content in %1: %2", where, detail);
    case IoFailure:
        if (detail.isEmpty())
            return i18n("Could not read %1", where);
        return i18n("Could not read %1: %2", where, detail);
    }
    return detail;
}
