#include "statestore.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QDebug>

namespace {
const char *const kLastImagePathKey = "last_image_path";
const char *const kLastIndexKey = "last_index";
const char *const kImageCountKey = "image_count";
}

DirectoryState::DirectoryState()
    : lastIndex(0),
    imageCount(-1)
{
}

DirectoryState::DirectoryState(const QString &path, int index, int count)
    : lastImagePath(path),
    lastIndex(index),
    imageCount(count)
{
}

StateStore::StateStore(const QString &filePath)
    : m_filePath(filePath)
{
}

QString StateStore::normalizeDirectory(const QString &dir)
{
    QFileInfo info(dir);
    QString canonical = info.canonicalFilePath();
    if (canonical.isEmpty()) {
        // 目录不存在或无法解析时退回到绝对路径
        return QDir::cleanPath(info.absoluteFilePath());
    }
    return canonical;
}

QMap<QString, DirectoryState> StateStore::load() const
{
    QMap<QString, DirectoryState> states;

    QFile file(m_filePath);
    if (!file.exists()) {
        qDebug() << "No state file yet:" << m_filePath;
        return states;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Cannot read state file, resume disabled:"
                   << m_filePath << file.errorString();
        return states;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Malformed state file, resume disabled:" << m_filePath
                   << parseError.errorString();
        return states;
    }

    const QJsonObject root = doc.object();
    for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
        if (!it.value().isObject()) {
            qWarning() << "Skipping malformed state entry:" << it.key();
            continue;
        }
        const QJsonObject entry = it.value().toObject();
        const QJsonValue path = entry.value(kLastImagePathKey);
        if (!path.isString()) {
            qWarning() << "Skipping state entry without image path:" << it.key();
            continue;
        }

        DirectoryState state;
        state.lastImagePath = path.toString();
        state.lastIndex = entry.value(kLastIndexKey).toInt(0);
        state.imageCount = entry.value(kImageCountKey).toInt(-1);
        states.insert(it.key(), state);
    }

    qDebug() << "读取位置记录:" << states.size() << "个目录";
    return states;
}

bool StateStore::stateFor(const QString &dir, DirectoryState *state) const
{
    const QMap<QString, DirectoryState> states = load();
    auto it = states.constFind(normalizeDirectory(dir));
    if (it == states.constEnd()) {
        return false;
    }
    if (state) {
        *state = it.value();
    }
    return true;
}

bool StateStore::save(const QString &dir, const DirectoryState &state) const
{
    QMap<QString, DirectoryState> states = load();
    states.insert(normalizeDirectory(dir), state);
    return write(states);
}

bool StateStore::write(const QMap<QString, DirectoryState> &states) const
{
    QFileInfo fileInfo(m_filePath);
    if (!QDir().mkpath(fileInfo.absolutePath())) {
        qWarning() << "Cannot create directory for state file:" << fileInfo.absolutePath();
        return false;
    }

    QJsonObject root;
    for (auto it = states.constBegin(); it != states.constEnd(); ++it) {
        QJsonObject entry;
        entry.insert(kLastImagePathKey, it.value().lastImagePath);
        entry.insert(kLastIndexKey, it.value().lastIndex);
        if (it.value().imageCount >= 0) {
            entry.insert(kImageCountKey, it.value().imageCount);
        }
        root.insert(it.key(), entry);
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Cannot save state file:" << m_filePath << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "Cannot save state file:" << m_filePath << file.errorString();
        return false;
    }

    qDebug() << "保存位置记录:" << states.size() << "个目录";
    return true;
}

StartPosition StateStore::resolveStartPosition(const QStringList &images,
                                               const DirectoryState *saved,
                                               bool hasStartIndex,
                                               int startIndex)
{
    StartPosition position;
    const int count = images.size();

    if (hasStartIndex) {
        if (startIndex >= 0 && startIndex < count) {
            position.index = startIndex;
            position.source = StartPosition::StartIndexOverride;
            position.message = QString("Starting at index %1").arg(startIndex);
        } else {
            position.message = QString("Start index %1 out of range [0, %2), starting at 0")
                                   .arg(startIndex)
                                   .arg(count);
        }
        return position;
    }

    if (!saved) {
        return position;
    }

    // 优先按路径恢复，过滤规则或排序变化后仍然有效
    const int pathIndex = images.indexOf(saved->lastImagePath);
    if (pathIndex >= 0) {
        position.index = pathIndex;
        position.source = StartPosition::SavedPath;
        position.message = QString("Resuming at %1 (index %2)")
                               .arg(saved->lastImagePath)
                               .arg(pathIndex);
        return position;
    }

    const bool indexInRange = saved->lastIndex >= 0 && saved->lastIndex < count;
    const bool countMatches = saved->imageCount < 0 || saved->imageCount == count;
    if (indexInRange && countMatches) {
        position.index = saved->lastIndex;
        position.source = StartPosition::SavedIndex;
        position.message = QString("Saved image not found, resuming at index %1")
                               .arg(saved->lastIndex);
        return position;
    }

    if (saved->imageCount >= 0) {
        position.message = QString("Image count changed (saved %1, now %2), starting from the beginning")
                               .arg(saved->imageCount)
                               .arg(count);
    } else {
        position.message = QString("Saved index %1 is out of range for %2 images, starting from the beginning")
                               .arg(saved->lastIndex)
                               .arg(count);
    }
    return position;
}
