// slideshowsession.h
#ifndef SLIDESHOWSESSION_H
#define SLIDESHOWSESSION_H

#include <QString>
#include <QStringList>
#include "configmanager.h"

struct SlideshowConfig;
class NavigationController;

// 校验根目录、加载忽略列表并扫描图片；成功时 rootDir 被规范化。
// 返回 false 时 errorMessage 为致命错误，程序应以 1 退出
bool prepareRun(SlideshowConfig *config, QStringList *images, QString *errorMessage);

// 退出时按 -c 和退出策略保存当前位置，写入时返回 true
bool saveOnExit(const SlideshowConfig &config,
                ConfigManager::QuitPolicy policy,
                const NavigationController &navigation);

#endif // SLIDESHOWSESSION_H
