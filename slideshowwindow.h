// slideshowwindow.h
#ifndef SLIDESHOWWINDOW_H
#define SLIDESHOWWINDOW_H

#define SLIDESHOW_ENABLE_DEBUG_LOGS 0

#if SLIDESHOW_ENABLE_DEBUG_LOGS
#define SLIDESHOW_DEBUG_LOG qDebug()
#else
#define SLIDESHOW_DEBUG_LOG if(false) qDebug()
#endif

#include <QWidget>
#include <QPixmap>
#include <QImage>
#include <QStringList>

#include "configmanager.h"
#include "slideshowconfig.h"

class DeferredTask;
class NavigationController;

class SlideshowWindow : public QWidget
{
    Q_OBJECT

public:
    SlideshowWindow(const SlideshowConfig &config,
                    const QStringList &images,
                    int startIndex,
                    QWidget *parent = nullptr);
    ~SlideshowWindow();

    // 按当前配置显示窗口（全屏或恢复上次的窗口大小）
    void showInitial();

public slots:
    void startSlideshow();
    void displayCurrentImage();
    void toggleFullscreen();
    void quitWithPolicy(ConfigManager::QuitPolicy policy);

protected:
    void paintEvent(QPaintEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onRotationChanged(int degrees);
    void onResizeSettled();
    void skipUnreadableImage();

private:
    // 图片载入与变换
    QImage readImage(const QString &filePath);
    void applyTransformations();
    void rescaleToWindow();
    QRect imageArea() const;

    void updateWindowTitle();
    QString infoText() const;

    // ini配置管理相关
    void loadConfiguration();
    void saveConfiguration();

    void stopTimers();

    SlideshowConfig m_config;
    NavigationController *m_navigation;

    QPixmap originalPixmap;
    QPixmap pixmap;          // 旋转后的图片
    QPixmap scaledPixmap;    // 缩放到窗口大小的图片
    QString currentImagePath;
    QString errorMessage;

    DeferredTask *m_resizeTask;

    ConfigManager::QuitPolicy m_closePolicy;
    bool m_closing;

    ConfigManager *configManager;
    ConfigManager::Config currentConfig;
};

#endif // SLIDESHOWWINDOW_H
