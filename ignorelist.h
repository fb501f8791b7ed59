#ifndef IGNORELIST_H
#define IGNORELIST_H

#include <QString>
#include <QStringList>
#include <QSet>

class IgnoreList
{
public:
    // 读取忽略文件夹列表；文件不存在时写入默认列表。
    // 文件损坏时返回空集合，不阻止幻灯片运行。
    static QSet<QString> load(const QString &filePath);

    static bool save(const QString &filePath, const QStringList &folders);

    static QStringList defaultFolders();
};

#endif // IGNORELIST_H
