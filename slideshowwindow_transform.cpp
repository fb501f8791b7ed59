// slideshowwindow_transform.cpp
#include "slideshowwindow.h"
#include "navigationcontroller.h"
#include <QTransform>

void SlideshowWindow::onRotationChanged(int degrees)
{
    Q_UNUSED(degrees);
    if (originalPixmap.isNull()) return;

    applyTransformations();
}

void SlideshowWindow::applyTransformations()
{
    if (originalPixmap.isNull()) return;

    const int rotationAngle = m_navigation->rotation();
    if (rotationAngle == 0) {
        pixmap = originalPixmap;
    } else {
        // 旋转90度的倍数不需要平移，transformed() 会重新计算包围盒
        QTransform transform;
        transform.rotate(rotationAngle);
        pixmap = originalPixmap.transformed(transform, Qt::SmoothTransformation);
    }

    rescaleToWindow();
    update();
}
