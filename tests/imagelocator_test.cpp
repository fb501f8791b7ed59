// imagelocator_test.cpp
#include "imagelocator.h"
#include "testutils.h"
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <gtest/gtest.h>

namespace {

QSet<QString> folders(const QStringList &names)
{
    QSet<QString> set;
    for (const QString &name : names) {
        set.insert(name);
    }
    return set;
}

class ImageLocatorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tempDir.isValid());
        root = tempDir.path();
    }

    QTemporaryDir tempDir;
    QString root;
};

} // namespace

TEST_F(ImageLocatorTest, SkipsIgnoredFolderAndKeepsOrder)
{
    ASSERT_TRUE(touchFile(root, "a.jpg"));
    ASSERT_TRUE(touchFile(root, "PREVIEW/b.jpg"));
    ASSERT_TRUE(touchFile(root, "c.png"));

    ImageLocator locator(folders({"PREVIEW"}));

    EXPECT_EQ(relativeTo(root, locator.scan(root, true)),
              QStringList({"a.jpg", "c.png"}));
    EXPECT_EQ(relativeTo(root, locator.scan(root, false)),
              QStringList({"PREVIEW/b.jpg", "a.jpg", "c.png"}));
}

TEST_F(ImageLocatorTest, MatchesExtensionsCaseInsensitively)
{
    ASSERT_TRUE(touchFile(root, "one.JPG"));
    ASSERT_TRUE(touchFile(root, "two.Jpeg"));
    ASSERT_TRUE(touchFile(root, "three.TIF"));
    ASSERT_TRUE(touchFile(root, "four.webp"));
    ASSERT_TRUE(touchFile(root, "five.tiff"));
    ASSERT_TRUE(touchFile(root, "six.gif"));
    ASSERT_TRUE(touchFile(root, "seven.bmp"));
    ASSERT_TRUE(touchFile(root, "notes.txt"));
    ASSERT_TRUE(touchFile(root, "backup.jpg.bak"));
    ASSERT_TRUE(touchFile(root, "jpg"));

    ImageLocator locator;
    EXPECT_EQ(relativeTo(root, locator.scan(root)),
              QStringList({"five.tiff", "four.webp", "one.JPG", "seven.bmp",
                           "six.gif", "three.TIF", "two.Jpeg"}));
}

TEST_F(ImageLocatorTest, IgnoresAnyNestedFolderSegment)
{
    ASSERT_TRUE(touchFile(root, "trip/THUMBNAIL/day1/x.png"));
    ASSERT_TRUE(touchFile(root, "trip/day2/y.png"));
    ASSERT_TRUE(touchFile(root, "trip/day2/PREVIEW/z.png"));

    ImageLocator locator(folders({"PREVIEW", "THUMBNAIL"}));
    EXPECT_EQ(relativeTo(root, locator.scan(root)),
              QStringList({"trip/day2/y.png"}));
}

TEST_F(ImageLocatorTest, FolderMatchIsExactAndCaseSensitive)
{
    ASSERT_TRUE(touchFile(root, "preview/a.jpg"));
    ASSERT_TRUE(touchFile(root, "PREVIEWS/b.jpg"));
    ASSERT_TRUE(touchFile(root, "PREVIEW.jpg"));

    ImageLocator locator(folders({"PREVIEW"}));
    EXPECT_EQ(relativeTo(root, locator.scan(root)),
              QStringList({"PREVIEW.jpg", "PREVIEWS/b.jpg", "preview/a.jpg"}));
}

TEST_F(ImageLocatorTest, RootSegmentsAreNotFiltered)
{
    const QString previewRoot = QDir(root).filePath("PREVIEW");
    ASSERT_TRUE(touchFile(previewRoot, "a.jpg"));

    ImageLocator locator(folders({"PREVIEW"}));
    EXPECT_EQ(relativeTo(previewRoot, locator.scan(previewRoot)),
              QStringList({"a.jpg"}));
}

TEST_F(ImageLocatorTest, UnfilteredScanIsSuperset)
{
    ASSERT_TRUE(touchFile(root, "a/b/c.jpg"));
    ASSERT_TRUE(touchFile(root, "a/THUMBNAIL/d.jpg"));
    ASSERT_TRUE(touchFile(root, "PREVIEW/e.gif"));
    ASSERT_TRUE(touchFile(root, "f.bmp"));

    ImageLocator locator(folders({"PREVIEW", "THUMBNAIL"}));
    const QStringList filtered = locator.scan(root, true);
    const QStringList all = locator.scan(root, false);

    EXPECT_EQ(filtered.size(), 2);
    EXPECT_EQ(all.size(), 4);
    for (const QString &path : filtered) {
        EXPECT_TRUE(all.contains(path)) << path.toStdString();
    }
}

TEST_F(ImageLocatorTest, ResultIsSortedAndAbsolute)
{
    ASSERT_TRUE(touchFile(root, "z/1.png"));
    ASSERT_TRUE(touchFile(root, "b.png"));
    ASSERT_TRUE(touchFile(root, "B/2.png"));
    ASSERT_TRUE(touchFile(root, "a/9.png"));

    ImageLocator locator;
    const QStringList images = locator.scan(root);

    QStringList sorted = images;
    sorted.sort();
    EXPECT_EQ(images, sorted);
    for (const QString &path : images) {
        EXPECT_TRUE(QDir::isAbsolutePath(path)) << path.toStdString();
    }
}

TEST_F(ImageLocatorTest, MissingRootYieldsEmptyList)
{
    ImageLocator locator;
    EXPECT_TRUE(locator.scan(QDir(root).filePath("does-not-exist")).isEmpty());
}

TEST_F(ImageLocatorTest, UnreadableSubtreeDoesNotAbortScan)
{
    ASSERT_TRUE(touchFile(root, "open/a.jpg"));
    ASSERT_TRUE(touchFile(root, "locked/b.jpg"));
    ASSERT_TRUE(touchFile(root, "z.jpg"));

    const QString locked = QDir(root).filePath("locked");
    ASSERT_TRUE(QFile::setPermissions(locked, QFileDevice::Permissions()));

    ImageLocator locator;
    const QStringList images = relativeTo(root, locator.scan(root));

    QFile::setPermissions(locked, QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);

    EXPECT_TRUE(images.contains("open/a.jpg"));
    EXPECT_TRUE(images.contains("z.jpg"));
}

TEST(ImageLocatorStaticTest, SupportedImagePredicate)
{
    EXPECT_TRUE(ImageLocator::isSupportedImage("/x/photo.JPEG"));
    EXPECT_TRUE(ImageLocator::isSupportedImage("photo.tif"));
    EXPECT_FALSE(ImageLocator::isSupportedImage("photo.heic"));
    EXPECT_FALSE(ImageLocator::isSupportedImage("/x/png"));
}

TEST(ImageLocatorStaticTest, RelativePathForDisplay)
{
    EXPECT_EQ(ImageLocator::relativePath("/photos", "/photos/2023/a.jpg"),
              QString("2023/a.jpg"));
}
