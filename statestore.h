#ifndef STATESTORE_H
#define STATESTORE_H

#include <QString>
#include <QStringList>
#include <QMap>

struct DirectoryState
{
    QString lastImagePath;
    int lastIndex;
    int imageCount; // -1 表示未记录

    DirectoryState();
    DirectoryState(const QString &path, int index, int count = -1);
};

// 启动索引的计算结果
struct StartPosition
{
    enum Source {
        Default,
        StartIndexOverride,
        SavedPath,
        SavedIndex
    };

    int index;
    Source source;
    QString message;

    StartPosition() : index(0), source(Default) {}
};

class StateStore
{
public:
    explicit StateStore(const QString &filePath);

    // 规范化目录路径（绝对路径，解析符号链接），作为映射键
    static QString normalizeDirectory(const QString &dir);

    QMap<QString, DirectoryState> load() const;

    bool stateFor(const QString &dir, DirectoryState *state) const;

    // 读取-修改-写回，保留其他目录的记录
    bool save(const QString &dir, const DirectoryState &state) const;

    // saved 为空指针表示没有保存记录；hasStartIndex 为 true 时 startIndex 优先
    static StartPosition resolveStartPosition(const QStringList &images,
                                              const DirectoryState *saved,
                                              bool hasStartIndex = false,
                                              int startIndex = 0);

private:
    bool write(const QMap<QString, DirectoryState> &states) const;

    QString m_filePath;
};

#endif // STATESTORE_H
