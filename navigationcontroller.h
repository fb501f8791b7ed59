// navigationcontroller.h
#ifndef NAVIGATIONCONTROLLER_H
#define NAVIGATIONCONTROLLER_H

#include <QObject>
#include <QString>
#include <QStringList>

class DeferredTask;

class NavigationController : public QObject
{
    Q_OBJECT

public:
    enum RotateDirection {
        RotateClockwise,
        RotateCounterClockwise
    };

    static constexpr int MaxDelaySeconds = 9;

    NavigationController(const QStringList &images,
                         int startIndex = 0,
                         int delaySeconds = 3,
                         QObject *parent = nullptr);

    int count() const { return m_images.size(); }
    int currentIndex() const { return m_currentIndex; }
    QString currentPath() const;

    bool isAutoPlayEnabled() const { return m_autoPlay; }
    int delaySeconds() const { return m_delaySeconds; }
    int rotation() const { return m_rotation; }

    // 自动播放定时器是否在等待触发
    bool isTimerArmed() const;
    int timerIntervalMs() const;

    static bool isValidDelay(int seconds);

public slots:
    void start();
    void stop();

    void next();
    void previous();
    void first();
    void last();
    bool goTo(int index);

    bool setDelay(int seconds);
    void toggleAutoPlay();
    void setAutoPlayEnabled(bool enabled);

    void rotate(RotateDirection direction);

    // 当前图片显示成功；因全部失败而停下的自动播放在这里恢复
    void markDisplayed();
    // 当前图片无法显示，沿上一次切换的方向跳过；全部失败时返回 false
    bool skipUnreadable();

signals:
    void currentIndexChanged(int index);
    void autoPlayChanged(bool enabled);
    void delayChanged(int seconds);
    void rotationChanged(int degrees);

private slots:
    void onAutoPlayTimeout();

private:
    void setCurrentIndex(int index);
    void step(int direction);
    void rearmTimer();

    QStringList m_images;
    int m_currentIndex;
    bool m_autoPlay;
    int m_delaySeconds;
    int m_rotation;
    bool m_running;
    int m_consecutiveFailures;
    int m_direction;         // 1 向后，-1 向前
    bool m_stoppedOnFailure;
    DeferredTask *m_autoPlayTask;
};

#endif // NAVIGATIONCONTROLLER_H
