// deferredtask.h
#ifndef DEFERREDTASK_H
#define DEFERREDTASK_H

#include <QObject>
#include <QTimer>

// 可取消的单次延迟任务：重复 schedule() 会取消上一次并重新计时
class DeferredTask : public QObject
{
    Q_OBJECT

public:
    explicit DeferredTask(int delayMs = 0, QObject *parent = nullptr);

    void schedule();
    void schedule(int delayMs);
    void cancel();

    bool isPending() const;
    int delay() const { return m_delayMs; }
    void setDelay(int delayMs);

signals:
    void triggered();

private:
    QTimer *m_timer;
    int m_delayMs;
};

#endif // DEFERREDTASK_H
