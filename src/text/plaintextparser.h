#ifndef BLINKREADER_PLAINTEXTPARSER_H
#define BLINKREADER_PLAINTEXTPARSER_H

#include "sourceparser.h"

class PlainTextParser : public SourceParser
{
public:
    QStringList extensions() const override;
    bool extractText(const QByteArray &bytes, QString &text,
                     QString &errorDetail) const override;
};

#endif // BLINKREADER_PLAINTEXTPARSER_H
