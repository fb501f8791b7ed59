#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QString>
#include <QPoint>
#include <QSize>

class ConfigManager
{
public:
    // 退出时是否保存当前位置
    enum QuitPolicy {
        SaveOnQuit,
        DiscardOnQuit
    };

    // 配置结构体
    struct Config {
        // 窗口状态
        QPoint windowPosition;
        QSize windowSize;
        bool windowMaximized;

        // 默认幻灯间隔（秒）
        int defaultDelay;

        // Q 键和 Escape 键的退出策略
        QuitPolicy quitKeyPolicy;
        QuitPolicy escapeKeyPolicy;

        // 默认构造函数
        Config();
    };

    ConfigManager(const QString& filename = "slideshow.ini");

    // 保存配置到文件
    bool saveConfig(const Config& config);

    // 从文件加载配置
    Config loadConfig();

    // 获取配置文件路径
    QString getConfigPath() const;

    static QString policyToString(QuitPolicy policy);
    static bool policyFromString(const QString &text, QuitPolicy *policy);

private:
    QString configPath;
};

#endif // CONFIGMANAGER_H
