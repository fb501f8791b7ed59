#include "ignorelist.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QDebug>

namespace {
const char *const kIgnoreFoldersKey = "ignore_folders";
}

QStringList IgnoreList::defaultFolders()
{
    return {"PREVIEW", "THUMBNAIL"};
}

bool IgnoreList::save(const QString &filePath, const QStringList &folders)
{
    QFileInfo fileInfo(filePath);
    if (!QDir().mkpath(fileInfo.absolutePath())) {
        qWarning() << "Cannot create directory for ignore list:" << fileInfo.absolutePath();
        return false;
    }

    QJsonObject root;
    root.insert(kIgnoreFoldersKey, QJsonArray::fromStringList(folders));

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Cannot write ignore list:" << filePath << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "Cannot write ignore list:" << filePath << file.errorString();
        return false;
    }
    return true;
}

QSet<QString> IgnoreList::load(const QString &filePath)
{
    QSet<QString> folders;

    if (!QFileInfo::exists(filePath)) {
        const QStringList defaults = defaultFolders();
        if (save(filePath, defaults)) {
            qInfo() << "Created ignore list with defaults:" << filePath;
        }
        for (const QString &name : defaults) {
            folders.insert(name);
        }
        return folders;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Cannot read ignore list, folder filtering disabled:"
                   << filePath << file.errorString();
        return folders;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "Malformed ignore list, folder filtering disabled:"
                   << filePath << parseError.errorString();
        return folders;
    }

    const QJsonValue value = doc.object().value(kIgnoreFoldersKey);
    if (!doc.isObject() || !value.isArray()) {
        qWarning() << "Ignore list has no" << kIgnoreFoldersKey
                   << "array, folder filtering disabled:" << filePath;
        return folders;
    }

    const QJsonArray array = value.toArray();
    for (const QJsonValue &entry : array) {
        if (!entry.isString()) {
            qWarning() << "Skipping non-string ignore entry:" << entry;
            continue;
        }
        const QString name = entry.toString();
        if (!name.isEmpty()) {
            folders.insert(name);
        }
    }

    qDebug() << "忽略文件夹:" << folders.values();
    return folders;
}
