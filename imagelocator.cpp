#include "imagelocator.h"
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QDebug>

ImageLocator::ImageLocator(const QSet<QString> &ignoreFolders)
    : m_ignoreFolders(ignoreFolders)
{
}

const QStringList &ImageLocator::supportedSuffixes()
{
    static const QStringList suffixes = {
        "jpg", "jpeg", "png", "gif", "bmp", "webp", "tiff", "tif"
    };
    return suffixes;
}

bool ImageLocator::isSupportedImage(const QString &filePath)
{
    QString suffix = QFileInfo(filePath).suffix().toLower();
    return !suffix.isEmpty() && supportedSuffixes().contains(suffix);
}

QString ImageLocator::relativePath(const QString &rootDir, const QString &filePath)
{
    return QDir(rootDir).relativeFilePath(filePath);
}

QStringList ImageLocator::scan(const QString &rootDir, bool ignoreEnabled) const
{
    QStringList imagePaths;

    QDir root(rootDir);
    if (!root.exists()) {
        qWarning() << "Scan root does not exist:" << rootDir;
        return imagePaths;
    }

    const QString rootPath = root.absolutePath();

    // 不跟随符号链接目录，避免循环；无法读取的子目录会被迭代器跳过
    QDirIterator it(rootPath,
                    QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);

    int skippedByIgnore = 0;
    while (it.hasNext()) {
        const QString path = it.next();

        if (!isSupportedImage(path)) {
            continue;
        }

        if (ignoreEnabled && isInIgnoredFolder(relativePath(rootPath, path))) {
            skippedByIgnore++;
            continue;
        }

        imagePaths.append(path);
    }

    imagePaths.removeDuplicates();
    imagePaths.sort();

    qDebug() << "扫描完成:" << rootPath << "图片:" << imagePaths.size()
             << "忽略:" << skippedByIgnore;
    return imagePaths;
}

bool ImageLocator::isInIgnoredFolder(const QString &relativeFilePath) const
{
    if (m_ignoreFolders.isEmpty()) {
        return false;
    }

    QStringList segments = relativeFilePath.split('/', Qt::SkipEmptyParts);
    // 最后一段是文件名，只检查目录部分
    if (!segments.isEmpty()) {
        segments.removeLast();
    }

    for (const QString &segment : segments) {
        if (m_ignoreFolders.contains(segment)) {
            return true;
        }
    }
    return false;
}
