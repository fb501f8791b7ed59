// configmanager_test.cpp
#include "configmanager.h"
#include "navigationcontroller.h"
#include "testutils.h"
#include <QDir>
#include <QTemporaryDir>
#include <gtest/gtest.h>

TEST(ConfigManagerTest, MissingFileGivesDefaults)
{
    QTemporaryDir tempDir;
    ASSERT_TRUE(tempDir.isValid());

    ConfigManager manager(QDir(tempDir.path()).filePath("slideshow.ini"));
    ConfigManager::Config config = manager.loadConfig();

    EXPECT_EQ(config.windowSize, QSize(1024, 768));
    EXPECT_FALSE(config.windowMaximized);
    EXPECT_EQ(config.defaultDelay, 3);
    EXPECT_EQ(config.quitKeyPolicy, ConfigManager::SaveOnQuit);
    EXPECT_EQ(config.escapeKeyPolicy, ConfigManager::SaveOnQuit);
}

TEST(ConfigManagerTest, SaveAndLoad)
{
    QTemporaryDir tempDir;
    ASSERT_TRUE(tempDir.isValid());
    const QString path = QDir(tempDir.path()).filePath("nested/slideshow.ini");

    ConfigManager::Config config;
    config.windowPosition = QPoint(40, 60);
    config.windowSize = QSize(800, 600);
    config.windowMaximized = true;
    config.defaultDelay = 7;
    config.escapeKeyPolicy = ConfigManager::DiscardOnQuit;

    ConfigManager manager(path);
    ASSERT_TRUE(manager.saveConfig(config));
    EXPECT_EQ(manager.getConfigPath(), path);

    ConfigManager::Config loaded = ConfigManager(path).loadConfig();
    EXPECT_EQ(loaded.windowPosition, QPoint(40, 60));
    EXPECT_EQ(loaded.windowSize, QSize(800, 600));
    EXPECT_TRUE(loaded.windowMaximized);
    EXPECT_EQ(loaded.defaultDelay, 7);
    EXPECT_EQ(loaded.quitKeyPolicy, ConfigManager::SaveOnQuit);
    EXPECT_EQ(loaded.escapeKeyPolicy, ConfigManager::DiscardOnQuit);
}

TEST(ConfigManagerTest, InvalidValuesFallBackToDefaults)
{
    QTemporaryDir tempDir;
    ASSERT_TRUE(tempDir.isValid());
    const QString path = QDir(tempDir.path()).filePath("slideshow.ini");
    ASSERT_TRUE(writeTextFile(path,
                              "[slideshow]\n"
                              "defaultDelay=42\n"
                              "[quit]\n"
                              "qKey=maybe\n"
                              "escapeKey=discard\n"));

    ConfigManager::Config config = ConfigManager(path).loadConfig();
    EXPECT_EQ(config.defaultDelay, 3);
    EXPECT_EQ(config.quitKeyPolicy, ConfigManager::SaveOnQuit);
    EXPECT_EQ(config.escapeKeyPolicy, ConfigManager::DiscardOnQuit);
}

TEST(ConfigManagerTest, PolicyStrings)
{
    ConfigManager::QuitPolicy policy = ConfigManager::SaveOnQuit;
    EXPECT_TRUE(ConfigManager::policyFromString(" Discard ", &policy));
    EXPECT_EQ(policy, ConfigManager::DiscardOnQuit);
    EXPECT_FALSE(ConfigManager::policyFromString("keep", &policy));
    EXPECT_EQ(policy, ConfigManager::DiscardOnQuit);
    EXPECT_EQ(ConfigManager::policyToString(ConfigManager::SaveOnQuit), QString("save"));
}

TEST(ConfigManagerTest, DelayBoundsMatchNavigation)
{
    QTemporaryDir tempDir;
    ASSERT_TRUE(tempDir.isValid());
    const QString path = QDir(tempDir.path()).filePath("slideshow.ini");

    ASSERT_TRUE(writeTextFile(path, "[slideshow]\ndefaultDelay=9\n"));
    EXPECT_EQ(ConfigManager(path).loadConfig().defaultDelay, NavigationController::MaxDelaySeconds);

    ASSERT_TRUE(writeTextFile(path, "[slideshow]\ndefaultDelay=0\n"));
    EXPECT_EQ(ConfigManager(path).loadConfig().defaultDelay, 0);

    ASSERT_TRUE(writeTextFile(path, "[slideshow]\ndefaultDelay=10\n"));
    EXPECT_EQ(ConfigManager(path).loadConfig().defaultDelay, 3);
}
