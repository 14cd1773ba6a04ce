/*
 * readertab.h — One reading session: settings plus optional content
 *
 * Instances are created and destroyed only by TabRegistry.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_READERTAB_H
#define BLINKREADER_READERTAB_H

#include <QObject>
#include <QString>

#include "fontsettings.h"
#include "tabid.h"

class WordsManager;

class ReaderTab : public QObject
{
    Q_OBJECT

public:
    enum class Kind {
        Home,    // start page, no content, never persisted or closed
        Reader,
    };
    Q_ENUM(Kind)

    TabId id() const { return m_id; }
    Kind kind() const { return m_kind; }
    bool isReader() const { return m_kind == Kind::Reader; }

    QString name() const { return m_name; }
    QString sourcePath() const { return m_sourcePath; }

    const FontSettings &font() const { return m_font; }
    int wpm() const { return m_wpm; }

    /// nullptr for Home tabs.
    WordsManager *words() const { return m_words; }

private:
    friend class TabRegistry;

    ReaderTab(TabId id, Kind kind, const QString &name, QObject *parent);

    TabId m_id;
    Kind m_kind;
    QString m_name;
    QString m_sourcePath;
    FontSettings m_font;
    int m_wpm = 0;
    WordsManager *m_words = nullptr;
};

#endif // BLINKREADER_READERTAB_H
