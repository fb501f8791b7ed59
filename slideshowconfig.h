// slideshowconfig.h
#ifndef SLIDESHOWCONFIG_H
#define SLIDESHOWCONFIG_H

#include <QString>
#include <QStringList>
#include "configmanager.h"

class QCommandLineParser;

// 一次运行所需的全部配置，显式传给各个组件
struct SlideshowConfig
{
    QString rootDir;
    bool fullscreen;
    int delaySeconds;
    bool resume;            // -c：启动时恢复位置，退出时保存
    bool hasStartIndex;
    int startIndex;
    bool ignoreEnabled;

    QString ignoreListPath;
    QString stateFilePath;
    QString settingsPath;

    ConfigManager::QuitPolicy quitKeyPolicy;
    ConfigManager::QuitPolicy escapeKeyPolicy;

    SlideshowConfig();

    // 以 ini 中的默认值为基础
    static SlideshowConfig fromSettings(const ConfigManager::Config &settings,
                                        const QString &configDir);

    static QString defaultConfigDir();
};

enum CommandLineParseResult {
    CommandLineOk,
    CommandLineError,
    CommandLineHelpRequested,
    CommandLineVersionRequested
};

// 解析命令行，config 中已有的值作为默认值
CommandLineParseResult parseCommandLine(QCommandLineParser &parser,
                                        const QStringList &arguments,
                                        SlideshowConfig *config,
                                        QString *errorMessage);

#endif // SLIDESHOWCONFIG_H
