#include "notificationbus.h"

NotificationBus::NotificationBus(QObject *parent)
    : QObject(parent)
{
}

void NotificationBus::postWordChanged()
{
    post(Notification{Notification::Word, InvalidTabId, {}});
}

void NotificationBus::postFontChanged(TabId tabId, const FontSettings &font)
{
    post(Notification{Notification::Font, tabId, font});
}

void NotificationBus::post(const Notification &notification)
{
    m_pending.enqueue(notification);
    if (m_dispatching)
        return;

    m_dispatching = true;
    while (!m_pending.isEmpty()) {
        const Notification next = m_pending.dequeue();
        if (next.kind == Notification::Word)
            Q_EMIT wordChanged();
        else
            Q_EMIT fontChanged(next.tabId, next.font);
    }
    m_dispatching = false;
}
