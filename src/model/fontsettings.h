#ifndef BLINKREADER_FONTSETTINGS_H
#define BLINKREADER_FONTSETTINGS_H

#include <QString>

struct FontSettings {
    QString family;
    qreal pointSize = 48.0;

    bool operator==(const FontSettings &o) const
    {
        return family == o.family && qFuzzyCompare(pointSize, o.pointSize);
    }
    bool operator!=(const FontSettings &o) const { return !(*this == o); }
};

#endif // BLINKREADER_FONTSETTINGS_H
