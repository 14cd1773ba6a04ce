#include "plaintextparser.h"

QStringList PlainTextParser::extensions() const
{
    return {QStringLiteral("txt"), QStringLiteral("text")};
}

bool PlainTextParser::extractText(const QByteArray &bytes, QString &text,
                                  QString &errorDetail) const
{
    return decodeUtf8(bytes, text, errorDetail);
}
