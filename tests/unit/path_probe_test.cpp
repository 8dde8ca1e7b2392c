#include "qrpass/core/PathProbe.hpp"
#include "test_utils/TestUtils.hpp"

#include <filesystem>
#include <gtest/gtest.h>

using qrpass::core::PathError;
using qrpass::core::probeWritableDirectory;

TEST(PathProbe, AcceptsWritableAbsoluteDirectoryAndLeavesNoTrace)
{
    const qrpass::test_utils::TempDir dir{ "probe_" };
    ASSERT_TRUE(dir.valid());

    EXPECT_FALSE(probeWritableDirectory(dir.path()).has_value());
    EXPECT_TRUE(std::filesystem::is_empty(dir.path()));
}

TEST(PathProbe, RejectsRelativePaths)
{
    EXPECT_EQ(probeWritableDirectory("relative/dir"), PathError::NotAbsolute);
    EXPECT_EQ(probeWritableDirectory(""), PathError::NotAbsolute);
}

TEST(PathProbe, RejectsMissingDirectoriesAndFiles)
{
    const qrpass::test_utils::TempDir dir{ "probe_" };
    ASSERT_TRUE(dir.valid());

    EXPECT_EQ(probeWritableDirectory(dir.path() / "missing"), PathError::NotADirectory);

    const auto file{ dir.path() / "file.txt" };
    qrpass::test_utils::writeFileBytes(file, "x");
    EXPECT_EQ(probeWritableDirectory(file), PathError::NotADirectory);
}

#if !defined(_WIN32)
TEST(PathProbe, RejectsReadOnlyDirectory)
{
    const qrpass::test_utils::TempDir dir{ "probe_" };
    ASSERT_TRUE(dir.valid());
    const auto locked{ dir.path() / "locked" };
    ASSERT_TRUE(std::filesystem::create_directory(locked));
    std::filesystem::permissions(locked, std::filesystem::perms::owner_read | std::filesystem::perms::owner_exec,
                                 std::filesystem::perm_options::replace);
    if (qrpass::test_utils::permissionsAreBypassed(locked))
    {
        GTEST_SKIP() << "directory permissions are not enforced for this user";
    }

    EXPECT_EQ(probeWritableDirectory(locked), PathError::NotWritable);
}
#endif

TEST(PathProbe, DescribeNamesTheRule)
{
    EXPECT_NE(qrpass::core::describe(PathError::NotAbsolute).find("absolute"), std::string_view::npos);
    EXPECT_NE(qrpass::core::describe(PathError::NotWritable).find("writable"), std::string_view::npos);
}
