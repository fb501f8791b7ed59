#include "configmanager.h"
#include "navigationcontroller.h"
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <QDebug>

ConfigManager::Config::Config()
    : windowPosition(-1, -1),
    windowSize(1024, 768),
    windowMaximized(false),
    defaultDelay(3),
    quitKeyPolicy(SaveOnQuit),
    escapeKeyPolicy(SaveOnQuit)
{
}

ConfigManager::ConfigManager(const QString& filename)
{
    if (QFileInfo(filename).isAbsolute()) {
        configPath = filename;
    } else {
        QString configDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
        configPath = QDir(configDir).filePath(filename);
    }
}

QString ConfigManager::getConfigPath() const
{
    return configPath;
}

QString ConfigManager::policyToString(QuitPolicy policy)
{
    return policy == DiscardOnQuit ? QStringLiteral("discard") : QStringLiteral("save");
}

bool ConfigManager::policyFromString(const QString &text, QuitPolicy *policy)
{
    const QString value = text.trimmed().toLower();
    if (value == "save") {
        *policy = SaveOnQuit;
        return true;
    }
    if (value == "discard") {
        *policy = DiscardOnQuit;
        return true;
    }
    return false;
}

bool ConfigManager::saveConfig(const Config& config)
{
    if (!QDir().mkpath(QFileInfo(configPath).absolutePath())) {
        qWarning() << "Cannot create config directory for" << configPath;
        return false;
    }

    QSettings settings(configPath, QSettings::IniFormat);

    settings.beginGroup("window");
    settings.setValue("position", config.windowPosition);
    settings.setValue("size", config.windowSize);
    settings.setValue("maximized", config.windowMaximized);
    settings.endGroup();

    settings.beginGroup("slideshow");
    settings.setValue("defaultDelay", config.defaultDelay);
    settings.endGroup();

    settings.beginGroup("quit");
    settings.setValue("qKey", policyToString(config.quitKeyPolicy));
    settings.setValue("escapeKey", policyToString(config.escapeKeyPolicy));
    settings.endGroup();

    settings.sync();
    if (settings.status() != QSettings::NoError) {
        qWarning() << "Failed to save config:" << configPath;
        return false;
    }

    qDebug() << "配置已保存:" << configPath;
    return true;
}

ConfigManager::Config ConfigManager::loadConfig()
{
    Config config;

    if (!QFileInfo::exists(configPath)) {
        qDebug() << "配置文件不存在，使用默认配置:" << configPath;
        return config;
    }

    QSettings settings(configPath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qWarning() << "Malformed config file, using defaults:" << configPath;
        return config;
    }

    // 窗口状态
    settings.beginGroup("window");
    config.windowPosition = settings.value("position", config.windowPosition).toPoint();
    QSize size = settings.value("size", config.windowSize).toSize();
    if (size.isValid() && !size.isEmpty()) {
        config.windowSize = size;
    }
    config.windowMaximized = settings.value("maximized", false).toBool();
    settings.endGroup();

    // 幻灯间隔
    settings.beginGroup("slideshow");
    bool ok = false;
    int delay = settings.value("defaultDelay", config.defaultDelay).toInt(&ok);
    if (ok && NavigationController::isValidDelay(delay)) {
        config.defaultDelay = delay;
    } else {
        qWarning() << "Invalid slideshow/defaultDelay in config, using" << config.defaultDelay;
    }
    settings.endGroup();

    // 退出策略
    settings.beginGroup("quit");
    if (settings.contains("qKey")
        && !policyFromString(settings.value("qKey").toString(), &config.quitKeyPolicy)) {
        qWarning() << "Invalid quit/qKey in config, using save";
    }
    if (settings.contains("escapeKey")
        && !policyFromString(settings.value("escapeKey").toString(), &config.escapeKeyPolicy)) {
        qWarning() << "Invalid quit/escapeKey in config, using save";
    }
    settings.endGroup();

    return config;
}
