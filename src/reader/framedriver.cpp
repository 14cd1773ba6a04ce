#include "framedriver.h"

FrameDriver::FrameDriver(QObject *parent)
    : QObject(parent)
{
    m_timer.setInterval(16);
    m_timer.setTimerType(Qt::PreciseTimer);
    connect(&m_timer, &QTimer::timeout, this, [this]() {
        Q_EMIT frame(m_clock.restart());
    });
}

void FrameDriver::start()
{
    m_clock.start();
    m_timer.start();
}

void FrameDriver::stop()
{
    m_timer.stop();
    m_clock.invalidate();
}
