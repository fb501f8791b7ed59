#ifndef IMAGELOCATOR_H
#define IMAGELOCATOR_H

#include <QString>
#include <QStringList>
#include <QSet>

class ImageLocator
{
public:
    explicit ImageLocator(const QSet<QString> &ignoreFolders = QSet<QString>());

    // 递归扫描目录，返回按路径排序的图片列表
    QStringList scan(const QString &rootDir, bool ignoreEnabled = true) const;

    // 检查文件扩展名是否是支持的图片格式（不区分大小写）
    static bool isSupportedImage(const QString &filePath);

    // 相对于根目录的显示路径
    static QString relativePath(const QString &rootDir, const QString &filePath);

private:
    static const QStringList &supportedSuffixes();
    bool isInIgnoredFolder(const QString &relativeFilePath) const;

    QSet<QString> m_ignoreFolders;
};

#endif // IMAGELOCATOR_H
