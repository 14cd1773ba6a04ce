/*
 * framedriver.h — Recurring frame loop feeding elapsed wall-clock time
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_FRAMEDRIVER_H
#define BLINKREADER_FRAMEDRIVER_H

#include <QElapsedTimer>
#include <QObject>
#include <QTimer>

class FrameDriver : public QObject
{
    Q_OBJECT

public:
    explicit FrameDriver(QObject *parent = nullptr);

    void setInterval(int msec) { m_timer.setInterval(msec); }
    int interval() const { return m_timer.interval(); }

    void start();
    void stop();
    bool isRunning() const { return m_timer.isActive(); }

Q_SIGNALS:
    /// Milliseconds since the previous frame.
    void frame(qint64 elapsedMs);

private:
    QTimer m_timer;
    QElapsedTimer m_clock;
};

#endif // BLINKREADER_FRAMEDRIVER_H
