// slideshowsession.cpp
#include "slideshowsession.h"
#include "ignorelist.h"
#include "imagelocator.h"
#include "navigationcontroller.h"
#include "slideshowconfig.h"
#include "statestore.h"
#include <QFileInfo>
#include <QSet>
#include <QDebug>

bool prepareRun(SlideshowConfig *config, QStringList *images, QString *errorMessage)
{
    QFileInfo rootInfo(config->rootDir);
    if (!rootInfo.isDir() || !rootInfo.isReadable()) {
        *errorMessage = QString("Error: '%1' is not a valid directory").arg(config->rootDir);
        return false;
    }
    config->rootDir = StateStore::normalizeDirectory(config->rootDir);

    // 即使 --no-ignore 也加载一次，确保默认文件存在
    QSet<QString> ignoreFolders = IgnoreList::load(config->ignoreListPath);
    if (!config->ignoreEnabled) {
        qInfo() << "Folder filtering disabled";
        ignoreFolders.clear();
    }

    qInfo().noquote() << QString("Searching for images in %1...").arg(config->rootDir);
    ImageLocator locator(ignoreFolders);
    *images = locator.scan(config->rootDir, config->ignoreEnabled);
    qInfo().noquote() << QString("Found %1 images").arg(images->size());

    if (images->isEmpty()) {
        *errorMessage = QStringLiteral("No images found!");
        return false;
    }
    return true;
}

bool saveOnExit(const SlideshowConfig &config,
                ConfigManager::QuitPolicy policy,
                const NavigationController &navigation)
{
    if (!config.resume || policy == ConfigManager::DiscardOnQuit) {
        return false;
    }
    if (navigation.count() == 0) {
        return false;
    }

    DirectoryState state(navigation.currentPath(),
                         navigation.currentIndex(),
                         navigation.count());
    StateStore store(config.stateFilePath);
    if (!store.save(config.rootDir, state)) {
        return false;
    }

    qInfo() << "Saved position" << state.lastIndex + 1 << "/" << state.imageCount
            << "for" << StateStore::normalizeDirectory(config.rootDir);
    return true;
}
