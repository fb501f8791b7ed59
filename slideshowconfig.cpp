// slideshowconfig.cpp
#include "slideshowconfig.h"
#include "navigationcontroller.h"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QStandardPaths>
#include <QDebug>

SlideshowConfig::SlideshowConfig()
    : rootDir("."),
    fullscreen(false),
    delaySeconds(3),
    resume(false),
    hasStartIndex(false),
    startIndex(0),
    ignoreEnabled(true),
    quitKeyPolicy(ConfigManager::SaveOnQuit),
    escapeKeyPolicy(ConfigManager::SaveOnQuit)
{
}

QString SlideshowConfig::defaultConfigDir()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
}

SlideshowConfig SlideshowConfig::fromSettings(const ConfigManager::Config &settings,
                                              const QString &configDir)
{
    SlideshowConfig config;
    QDir dir(configDir);

    config.delaySeconds = settings.defaultDelay;
    config.quitKeyPolicy = settings.quitKeyPolicy;
    config.escapeKeyPolicy = settings.escapeKeyPolicy;
    config.ignoreListPath = dir.filePath("ignore_folders.json");
    config.stateFilePath = dir.filePath("slideshow_state.json");
    config.settingsPath = dir.filePath("slideshow.ini");
    return config;
}

CommandLineParseResult parseCommandLine(QCommandLineParser &parser,
                                        const QStringList &arguments,
                                        SlideshowConfig *config,
                                        QString *errorMessage)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("main", "Image slideshow from a nested directory structure.\n\n"
                                            "Controls:\n"
                                            "  Left / Right    Previous / next image\n"
                                            "  Home / End      First / last image\n"
                                            "  Space           Toggle auto-play\n"
                                            "  0-9             Set delay in seconds (0 = manual)\n"
                                            "  , / .           Rotate left / right\n"
                                            "  F               Toggle fullscreen\n"
                                            "  Q / Escape      Quit"));
    parser.addPositionalArgument("directory",
                                 QCoreApplication::translate("main", "Root directory to search for images (default: current directory)."),
                                 "[directory]");

    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();

    QCommandLineOption fullscreenOption(QStringList() << "f" << "fullscreen",
                                        QCoreApplication::translate("main", "Start in fullscreen mode."));
    QCommandLineOption delayOption(QStringList() << "d" << "delay",
                                   QCoreApplication::translate("main", "Delay between images in seconds, 0-9 (0 = manual only)."),
                                   "seconds",
                                   QString::number(config->delaySeconds));
    QCommandLineOption continueOption(QStringList() << "c" << "continue",
                                      QCoreApplication::translate("main", "Continue from the last viewed image and remember it on exit."));
    QCommandLineOption startIndexOption(QStringList() << "s" << "start-index",
                                        QCoreApplication::translate("main", "Start at the given image index."),
                                        "index");
    QCommandLineOption noIgnoreOption("no-ignore",
                                      QCoreApplication::translate("main", "Do not skip images in ignored folders."));

    parser.addOption(fullscreenOption);
    parser.addOption(delayOption);
    parser.addOption(continueOption);
    parser.addOption(startIndexOption);
    parser.addOption(noIgnoreOption);

    if (!parser.parse(arguments)) {
        *errorMessage = parser.errorText();
        return CommandLineError;
    }

    if (parser.isSet(versionOption)) {
        return CommandLineVersionRequested;
    }
    if (parser.isSet(helpOption)) {
        return CommandLineHelpRequested;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() > 1) {
        *errorMessage = QCoreApplication::translate("main", "Only one directory may be given.");
        return CommandLineError;
    }
    if (!positional.isEmpty()) {
        config->rootDir = positional.first();
    }

    config->fullscreen = parser.isSet(fullscreenOption);
    config->resume = parser.isSet(continueOption);
    config->ignoreEnabled = !parser.isSet(noIgnoreOption);

    if (parser.isSet(delayOption)) {
        bool ok = false;
        int delay = parser.value(delayOption).toInt(&ok);
        if (ok && NavigationController::isValidDelay(delay)) {
            config->delaySeconds = delay;
        } else {
            qWarning() << "Invalid delay" << parser.value(delayOption)
                       << "(expected 0-9), using" << config->delaySeconds;
        }
    }

    if (parser.isSet(startIndexOption)) {
        bool ok = false;
        int index = parser.value(startIndexOption).toInt(&ok);
        config->hasStartIndex = true;
        // 非数字按越界处理，稍后回退到 0
        config->startIndex = ok ? index : -1;
        if (!ok) {
            qWarning() << "Invalid start index:" << parser.value(startIndexOption);
        }
    }

    return CommandLineOk;
}
