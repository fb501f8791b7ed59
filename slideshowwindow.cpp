// slideshowwindow.cpp
#include "slideshowwindow.h"
#include "deferredtask.h"
#include "navigationcontroller.h"
#include "slideshowsession.h"
#include <QApplication>
#include <QCloseEvent>
#include <QGuiApplication>
#include <QKeyEvent>
#include <QResizeEvent>
#include <QScreen>
#include <QTimer>
#include <QDebug>

namespace {
const int kResizeDebounceMs = 100;
const int kFirstDisplayDelayMs = 100;
}

SlideshowWindow::SlideshowWindow(const SlideshowConfig &config,
                                 const QStringList &images,
                                 int startIndex,
                                 QWidget *parent)
    : QWidget(parent),
    m_config(config),
    m_navigation(new NavigationController(images, startIndex, config.delaySeconds, this)),
    m_resizeTask(new DeferredTask(kResizeDebounceMs, this)),
    m_closePolicy(ConfigManager::SaveOnQuit),
    m_closing(false)
{
    // 创建配置管理器
    configManager = new ConfigManager(config.settingsPath);

    setWindowTitle(tr("Image Slideshow"));
    setFocusPolicy(Qt::StrongFocus);
    setAttribute(Qt::WA_OpaquePaintEvent);
    setMinimumSize(200, 150);

    connect(m_navigation, &NavigationController::currentIndexChanged,
            this, &SlideshowWindow::displayCurrentImage);
    connect(m_navigation, &NavigationController::rotationChanged,
            this, &SlideshowWindow::onRotationChanged);
    connect(m_navigation, &NavigationController::autoPlayChanged, this, [this](bool enabled) {
        qDebug() << "自动播放:" << enabled;
        updateWindowTitle();
        update();
    });
    connect(m_navigation, &NavigationController::delayChanged, this, [this](int seconds) {
        qDebug() << "幻灯间隔:" << seconds << "秒";
        update();
    });

    // 窗口大小变化合并为一次重绘
    connect(m_resizeTask, &DeferredTask::triggered, this, &SlideshowWindow::onResizeSettled);

    loadConfiguration();
}

SlideshowWindow::~SlideshowWindow()
{
    stopTimers();
    delete configManager;
}

void SlideshowWindow::showInitial()
{
    if (m_config.fullscreen) {
        showFullScreen();
    } else if (currentConfig.windowMaximized) {
        showMaximized();
    } else {
        show();
    }
    raise();
    activateWindow();

    // 等事件循环启动后再显示第一张
    QTimer::singleShot(kFirstDisplayDelayMs, this, &SlideshowWindow::startSlideshow);
}

void SlideshowWindow::startSlideshow()
{
    displayCurrentImage();
    m_navigation->start();
}

void SlideshowWindow::toggleFullscreen()
{
    if (isFullScreen()) {
        showNormal();
    } else {
        showFullScreen();
    }
}

void SlideshowWindow::quitWithPolicy(ConfigManager::QuitPolicy policy)
{
    m_closePolicy = policy;
    close();
}

void SlideshowWindow::stopTimers()
{
    m_navigation->stop();
    m_resizeTask->cancel();
}

// 关闭事件处理
void SlideshowWindow::closeEvent(QCloseEvent *event)
{
    if (!m_closing) {
        m_closing = true;
        stopTimers();
        // 窗口管理器关闭按保存处理
        saveOnExit(m_config, m_closePolicy, *m_navigation);
        saveConfiguration();
    }
    event->accept();
}

void SlideshowWindow::loadConfiguration()
{
    currentConfig = configManager->loadConfig();

    resize(currentConfig.windowSize);
    if (currentConfig.windowPosition.x() >= 0 && currentConfig.windowPosition.y() >= 0) {
        // 只在屏幕可见范围内恢复位置
        QScreen *screen = QGuiApplication::screenAt(currentConfig.windowPosition);
        if (screen) {
            move(currentConfig.windowPosition);
        }
    }
}

void SlideshowWindow::saveConfiguration()
{
    // 全屏时不记录窗口尺寸
    if (!isFullScreen()) {
        currentConfig.windowMaximized = isMaximized();
        if (!isMaximized()) {
            currentConfig.windowPosition = pos();
            currentConfig.windowSize = size();
        }
    }
    configManager->saveConfig(currentConfig);
}

void SlideshowWindow::keyPressEvent(QKeyEvent *event)
{
    SLIDESHOW_DEBUG_LOG << "key:" << event->key();

    const int key = event->key();
    if (key >= Qt::Key_0 && key <= Qt::Key_9) {
        m_navigation->setDelay(key - Qt::Key_0);
        return;
    }

    switch (key) {
    case Qt::Key_Right:
        m_navigation->next();
        break;
    case Qt::Key_Left:
        m_navigation->previous();
        break;
    case Qt::Key_Home:
        m_navigation->first();
        break;
    case Qt::Key_End:
        m_navigation->last();
        break;
    case Qt::Key_Space:
        m_navigation->toggleAutoPlay();
        break;
    case Qt::Key_Comma:
    case Qt::Key_Less:
        m_navigation->rotate(NavigationController::RotateCounterClockwise);
        break;
    case Qt::Key_Period:
    case Qt::Key_Greater:
        m_navigation->rotate(NavigationController::RotateClockwise);
        break;
    case Qt::Key_F:
        toggleFullscreen();
        break;
    case Qt::Key_Q:
        quitWithPolicy(m_config.quitKeyPolicy);
        break;
    case Qt::Key_Escape:
        quitWithPolicy(m_config.escapeKeyPolicy);
        break;
    default:
        QWidget::keyPressEvent(event);
        return;
    }
    event->accept();
}

void SlideshowWindow::resizeEvent(QResizeEvent *event)
{
    QWidget::resizeEvent(event);
    if (!pixmap.isNull()) {
        m_resizeTask->schedule();
    }
}

void SlideshowWindow::onResizeSettled()
{
    SLIDESHOW_DEBUG_LOG << "窗口尺寸稳定:" << size();
    rescaleToWindow();
    update();
}
