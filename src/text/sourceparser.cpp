#include "sourceparser.h"

#include <KLocalizedString>

#include <QStringDecoder>

bool SourceParser::decodeUtf8(const QByteArray &bytes, QString &text,
                              QString &errorDetail)
{
    QStringDecoder decoder(QStringDecoder::Utf8, QStringDecoder::Flag::Stateless);
    text = decoder.decode(bytes);
    if (decoder.hasError()) {
        text.clear();
        errorDetail = i18n("the file is not valid UTF-8 text");
        return false;
    }
    return true;
}
