/*
 * notificationbus.h — Synchronous fan-out of word and font changes
 *
 * Reactions are plain direct connections, invoked in registration order.
 * A notification posted from inside a reaction is queued and delivered once
 * the current dispatch has run to completion, so handlers never re-enter.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_NOTIFICATIONBUS_H
#define BLINKREADER_NOTIFICATIONBUS_H

#include <QObject>
#include <QQueue>

#include "fontsettings.h"
#include "tabid.h"

class NotificationBus : public QObject
{
    Q_OBJECT

public:
    explicit NotificationBus(QObject *parent = nullptr);

    void postWordChanged();
    void postFontChanged(TabId tabId, const FontSettings &font);

    bool isDispatching() const { return m_dispatching; }

Q_SIGNALS:
    /// The current word of the active tab changed.
    void wordChanged();
    /// New font for one tab.
    void fontChanged(TabId tabId, const FontSettings &font);

private:
    struct Notification {
        enum Kind { Word, Font };
        Kind kind = Word;
        TabId tabId = InvalidTabId;
        FontSettings font;
    };

    void post(const Notification &notification);

    QQueue<Notification> m_pending;
    bool m_dispatching = false;
};

#endif // BLINKREADER_NOTIFICATIONBUS_H
