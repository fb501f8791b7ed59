// slideshowwindow_view.cpp
#include "slideshowwindow.h"
#include "imagelocator.h"
#include "navigationcontroller.h"
#include <QFileInfo>
#include <QFont>
#include <QImageReader>
#include <QPainter>
#include <QTimer>
#include <QDebug>

namespace {
const int kInfoBarHeight = 30;
const qint64 kMaxImageFileSize = 500LL * 1024 * 1024;
}

void SlideshowWindow::displayCurrentImage()
{
    const QString imagePath = m_navigation->currentPath();
    if (imagePath.isEmpty()) {
        return;
    }

    QImage image = readImage(imagePath);
    if (image.isNull()) {
        // 延迟到下一轮事件循环，避免连续失败时递归
        QTimer::singleShot(0, this, &SlideshowWindow::skipUnreadableImage);
        return;
    }

    errorMessage.clear();
    currentImagePath = imagePath;
    originalPixmap = QPixmap::fromImage(image);
    m_navigation->markDisplayed();

    applyTransformations();
    updateWindowTitle();
}

void SlideshowWindow::skipUnreadableImage()
{
    if (m_closing) {
        return;
    }
    if (!m_navigation->skipUnreadable()) {
        originalPixmap = QPixmap();
        pixmap = QPixmap();
        scaledPixmap = QPixmap();
        errorMessage = tr("No readable images");
        update();
    }
}

// 读取一张图片；失败时返回空图片，由调用方跳过
QImage SlideshowWindow::readImage(const QString &filePath)
{
    const QFileInfo fileInfo(filePath);
    if (!fileInfo.isFile()) {
        qWarning() << "Image no longer exists:" << filePath;
        return QImage();
    }
    if (fileInfo.size() > kMaxImageFileSize) {
        qWarning() << "File too large:" << filePath << fileInfo.size() / (1024 * 1024) << "MB";
        return QImage();
    }

    // 显示前总会缩放到窗口，这里按原尺寸解码，内存由全局分配上限约束
    QImageReader reader(filePath);
    reader.setAutoTransform(true);
    QImage image = reader.read();
    if (image.isNull()) {
        qWarning() << "Cannot decode" << filePath << ":" << reader.errorString();
        return QImage();
    }

    SLIDESHOW_DEBUG_LOG << "Decoded" << filePath << image.size();
    return image;
}

QRect SlideshowWindow::imageArea() const
{
    return QRect(0, 0, width(), qMax(1, height() - kInfoBarHeight));
}

void SlideshowWindow::rescaleToWindow()
{
    if (pixmap.isNull()) {
        scaledPixmap = QPixmap();
        return;
    }

    const QSize area = imageArea().size();
    // 只缩小不放大
    if (pixmap.width() <= area.width() && pixmap.height() <= area.height()) {
        scaledPixmap = pixmap;
    } else {
        scaledPixmap = pixmap.scaled(area, Qt::KeepAspectRatio, Qt::SmoothTransformation);
    }
}

QString SlideshowWindow::infoText() const
{
    const QString status = m_navigation->isAutoPlayEnabled() ? tr("▶ AUTO") : tr("⏸ MANUAL");
    QString text = QString("%1 | %2/%3 | %4")
                       .arg(status)
                       .arg(m_navigation->currentIndex() + 1)
                       .arg(m_navigation->count())
                       .arg(ImageLocator::relativePath(m_config.rootDir, m_navigation->currentPath()));

    if (m_navigation->delaySeconds() == 0) {
        text += tr(" | delay: manual");
    } else {
        text += tr(" | delay: %1s").arg(m_navigation->delaySeconds());
    }
    if (m_navigation->rotation() != 0) {
        text += tr(" | rotated %1°").arg(m_navigation->rotation());
    }
    return text;
}

void SlideshowWindow::updateWindowTitle()
{
    if (currentImagePath.isEmpty()) {
        setWindowTitle(tr("Image Slideshow"));
        return;
    }

    QString title = QString(tr("%1 (%2/%3) - Image Slideshow"))
                        .arg(QFileInfo(currentImagePath).fileName())
                        .arg(m_navigation->currentIndex() + 1)
                        .arg(m_navigation->count());
    if (m_navigation->isAutoPlayEnabled()) {
        title += tr(" [auto]");
    }
    setWindowTitle(title);
}

void SlideshowWindow::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    if (!painter.isActive()) {
        qDebug() << "错误: 无法创建有效的 QPainter";
        return;
    }

    painter.fillRect(rect(), Qt::black);

    const QRect area = imageArea();
    if (!scaledPixmap.isNull()) {
        QPoint offset((area.width() - scaledPixmap.width()) / 2,
                      (area.height() - scaledPixmap.height()) / 2);
        painter.drawPixmap(offset, scaledPixmap);
    } else {
        painter.setPen(Qt::white);
        painter.drawText(area, Qt::AlignCenter,
                         errorMessage.isEmpty() ? tr("Loading...") : errorMessage);
    }

    // 底部信息栏
    QRect infoRect(0, area.bottom() + 1, width(), kInfoBarHeight);
    painter.fillRect(infoRect, Qt::darkGray);
    painter.setPen(Qt::white);
    painter.setFont(QFont("Arial", 12));
    painter.drawText(infoRect.adjusted(8, 0, -8, 0), Qt::AlignVCenter | Qt::AlignLeft,
                     painter.fontMetrics().elidedText(infoText(), Qt::ElideMiddle,
                                                      infoRect.width() - 16));
}
