/*
 * parseerror.h — Typed failure for source loading and segmentation
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_PARSEERROR_H
#define BLINKREADER_PARSEERROR_H

#include <QMetaType>
#include <QString>

#include <optional>

#include "word.h"

struct ParseError {
    enum Reason {
        UnsupportedFormat,
        MalformedContent,
        IoFailure,
    };

    Reason reason = MalformedContent;
    QString path;    // empty for pasted text
    QString detail;

    QString message() const;
};

Q_DECLARE_METATYPE(ParseError)

// Result of turning a source into words. Either words or an error, never both.
struct ParseResult {
    WordSequence words;
    std::optional<ParseError> error;

    bool ok() const { return !error.has_value(); }

    static ParseResult failure(ParseError::Reason reason, const QString &path,
                               const QString &detail)
    {
        ParseResult r;
        r.error = ParseError{reason, path, detail};
        return r;
    }
};

#endif // BLINKREADER_PARSEERROR_H
