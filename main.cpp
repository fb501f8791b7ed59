#include "slideshowwindow.h"
#include "configmanager.h"
#include "slideshowconfig.h"
#include "slideshowsession.h"
#include "statestore.h"
#include <QApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QImageReader>
#include <QLocale>
#include <QTranslator>
#include <QDebug>

#include <cstdio>

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // 设置应用程序信息
    app.setApplicationName("ImageSlideshow");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("ImageSlideshow");

    // 提高 Qt 图像内存限制到 1GB
    QImageReader::setAllocationLimit(1024);

    QList<QByteArray> supportedFormats = QImageReader::supportedImageFormats();
    if (!supportedFormats.contains("webp")) {
        qWarning() << "WebP format not supported - consider installing additional plugins";
    }

    // 加载应用程序翻译
    QTranslator appTranslator;
    const QString locale = QLocale::system().name();
    const QString translationsPath = QApplication::applicationDirPath() + "/translations";
    if (appTranslator.load("ImageSlideshow_" + locale, translationsPath)) {
        app.installTranslator(&appTranslator);
        qDebug() << "Loaded translation for locale:" << locale;
    }

    // ini 中的默认值，命令行参数可以覆盖
    const QString configDir = SlideshowConfig::defaultConfigDir();
    ConfigManager configManager(QDir(configDir).filePath("slideshow.ini"));
    SlideshowConfig config = SlideshowConfig::fromSettings(configManager.loadConfig(), configDir);

    QCommandLineParser parser;
    QString errorMessage;
    switch (parseCommandLine(parser, app.arguments(), &config, &errorMessage)) {
    case CommandLineOk:
        break;
    case CommandLineError:
        std::fprintf(stderr, "%s\n\n%s", qPrintable(errorMessage), qPrintable(parser.helpText()));
        return 1;
    case CommandLineVersionRequested:
        parser.showVersion();
        break;
    case CommandLineHelpRequested:
        parser.showHelp();
        break;
    }

    // 校验目录并扫描图片
    QStringList images;
    if (!prepareRun(&config, &images, &errorMessage)) {
        qCritical().noquote() << errorMessage;
        return 1;
    }

    // 计算起始位置
    StateStore stateStore(config.stateFilePath);
    DirectoryState savedState;
    const bool hasSavedState = config.resume && stateStore.stateFor(config.rootDir, &savedState);
    if (config.resume && !hasSavedState) {
        qInfo() << "No saved position for this directory, starting from the beginning";
    }

    const StartPosition start = StateStore::resolveStartPosition(images,
                                                                 hasSavedState ? &savedState : nullptr,
                                                                 config.hasStartIndex,
                                                                 config.startIndex);
    if (!start.message.isEmpty()) {
        if (config.hasStartIndex && start.source == StartPosition::Default) {
            qWarning().noquote() << start.message;
        } else {
            qInfo().noquote() << start.message;
        }
    }

    std::printf("\nControls:\n"
                "  Right Arrow / Left Arrow: Next / Previous image\n"
                "  Home / End: First / Last image\n"
                "  Space: Toggle auto-play\n"
                "  0-9: Set delay in seconds (0 = manual only)\n"
                "  , / .: Rotate left / right\n"
                "  F: Toggle fullscreen\n"
                "  Q or Escape: Quit\n"
                "\nStarting slideshow...\n\n");
    std::fflush(stdout);

    SlideshowWindow window(config, images, start.index);
    window.showInitial();

    return app.exec();
}
