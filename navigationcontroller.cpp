// navigationcontroller.cpp
#include "navigationcontroller.h"
#include "deferredtask.h"
#include <QDebug>

NavigationController::NavigationController(const QStringList &images,
                                           int startIndex,
                                           int delaySeconds,
                                           QObject *parent)
    : QObject(parent),
    m_images(images),
    m_currentIndex(0),
    m_autoPlay(false),
    m_delaySeconds(3),
    m_rotation(0),
    m_running(false),
    m_consecutiveFailures(0),
    m_direction(1),
    m_stoppedOnFailure(false),
    m_autoPlayTask(new DeferredTask(0, this))
{
    if (startIndex >= 0 && startIndex < m_images.size()) {
        m_currentIndex = startIndex;
    } else if (!m_images.isEmpty()) {
        qWarning() << "Start index out of range:" << startIndex << "using 0";
    }

    if (isValidDelay(delaySeconds)) {
        m_delaySeconds = delaySeconds;
    } else {
        qWarning() << "Invalid delay:" << delaySeconds << "using" << m_delaySeconds;
    }
    m_autoPlay = m_delaySeconds > 0;
    m_autoPlayTask->setDelay(m_delaySeconds * 1000);

    connect(m_autoPlayTask, &DeferredTask::triggered,
            this, &NavigationController::onAutoPlayTimeout);
}

QString NavigationController::currentPath() const
{
    if (m_images.isEmpty()) {
        return QString();
    }
    return m_images.at(m_currentIndex);
}

bool NavigationController::isTimerArmed() const
{
    return m_autoPlayTask->isPending();
}

int NavigationController::timerIntervalMs() const
{
    return m_autoPlayTask->delay();
}

bool NavigationController::isValidDelay(int seconds)
{
    return seconds >= 0 && seconds <= MaxDelaySeconds;
}

void NavigationController::start()
{
    m_running = true;
    m_stoppedOnFailure = false;
    rearmTimer();
}

void NavigationController::stop()
{
    m_running = false;
    m_stoppedOnFailure = false;
    m_autoPlayTask->cancel();
}

void NavigationController::next()
{
    m_direction = 1;
    step(m_direction);
}

void NavigationController::previous()
{
    m_direction = -1;
    step(m_direction);
}

void NavigationController::first()
{
    if (!m_images.isEmpty()) {
        m_direction = 1;
        setCurrentIndex(0);
    }
}

void NavigationController::last()
{
    if (!m_images.isEmpty()) {
        m_direction = -1;
        setCurrentIndex(m_images.size() - 1);
    }
}

bool NavigationController::goTo(int index)
{
    if (index < 0 || index >= m_images.size()) {
        qWarning() << "Cannot go to index" << index << "of" << m_images.size();
        return false;
    }
    m_direction = 1;
    setCurrentIndex(index);
    return true;
}

bool NavigationController::setDelay(int seconds)
{
    if (!isValidDelay(seconds)) {
        qWarning() << "Ignoring invalid delay:" << seconds;
        return false;
    }

    m_delaySeconds = seconds;
    m_autoPlayTask->setDelay(seconds * 1000);
    // 0 表示仅手动切换，定时器不再触发
    rearmTimer();

    emit delayChanged(m_delaySeconds);
    return true;
}

void NavigationController::toggleAutoPlay()
{
    setAutoPlayEnabled(!m_autoPlay);
}

void NavigationController::setAutoPlayEnabled(bool enabled)
{
    if (m_autoPlay == enabled) {
        return;
    }
    m_autoPlay = enabled;
    rearmTimer();
    emit autoPlayChanged(m_autoPlay);
}

void NavigationController::rotate(RotateDirection direction)
{
    if (direction == RotateClockwise) {
        m_rotation = (m_rotation + 90) % 360;
    } else {
        m_rotation = (m_rotation - 90 + 360) % 360;
    }
    emit rotationChanged(m_rotation);
}

void NavigationController::markDisplayed()
{
    m_consecutiveFailures = 0;
    if (m_stoppedOnFailure) {
        qInfo() << "Readable image found again, resuming navigation";
        start();
    }
}

bool NavigationController::skipUnreadable()
{
    m_consecutiveFailures++;
    if (m_consecutiveFailures >= m_images.size()) {
        qWarning() << "No readable image left, stopping navigation";
        stop();
        m_stoppedOnFailure = true;
        return false;
    }
    step(m_direction);
    return true;
}

void NavigationController::onAutoPlayTimeout()
{
    if (m_running && m_autoPlay && m_delaySeconds > 0) {
        next();
    }
}

void NavigationController::step(int direction)
{
    if (m_images.isEmpty()) {
        return;
    }
    const int size = m_images.size();
    setCurrentIndex((m_currentIndex + direction + size) % size);
}

void NavigationController::setCurrentIndex(int index)
{
    m_currentIndex = index;
    // 切换图片时重置旋转
    m_rotation = 0;
    rearmTimer();
    emit currentIndexChanged(m_currentIndex);
}

void NavigationController::rearmTimer()
{
    if (m_running && m_autoPlay && m_delaySeconds > 0 && m_images.size() > 1) {
        m_autoPlayTask->schedule();
    } else {
        m_autoPlayTask->cancel();
    }
}
