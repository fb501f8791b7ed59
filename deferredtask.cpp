// deferredtask.cpp
#include "deferredtask.h"

DeferredTask::DeferredTask(int delayMs, QObject *parent)
    : QObject(parent),
    m_timer(new QTimer(this)),
    m_delayMs(qMax(0, delayMs))
{
    m_timer->setSingleShot(true);
    connect(m_timer, &QTimer::timeout, this, &DeferredTask::triggered);
}

void DeferredTask::schedule()
{
    // start() 会先停止正在等待的计时
    m_timer->start(m_delayMs);
}

void DeferredTask::schedule(int delayMs)
{
    setDelay(delayMs);
    schedule();
}

void DeferredTask::cancel()
{
    m_timer->stop();
}

bool DeferredTask::isPending() const
{
    return m_timer->isActive();
}

void DeferredTask::setDelay(int delayMs)
{
    m_delayMs = qMax(0, delayMs);
}
