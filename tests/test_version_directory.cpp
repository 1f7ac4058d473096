#include "rtprov/version_directory.hpp"
#include "rtprov/errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;

namespace rtprov {

using namespace rtprov::testing;

class VersionDirectoryTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        root = scratch / "docker";
        fs::create_directories(root / "17.03.0-ce");
        fs::create_directories(root / "17.03.1-ce");
    }

    ScratchDir scratch;
    fs::path root;
};

TEST_F(VersionDirectoryTest, activatePointsCurrentAtVersion)
{
    VersionDirectoryManager vdm(root);

    auto link = vdm.activate(root / "17.03.1-ce");

    ASSERT_EQ(link, root / "current");
    ASSERT_TRUE(fs::is_symlink(link));
    ASSERT_EQ(fs::read_symlink(link), root / "17.03.1-ce");
    ASSERT_EQ(vdm.current_target(), root / "17.03.1-ce");
}

TEST_F(VersionDirectoryTest, repeatedActivationIsIdempotent)
{
    VersionDirectoryManager vdm(root);

    vdm.activate(root / "17.03.1-ce");
    ASSERT_NO_THROW(vdm.activate(root / "17.03.1-ce"));

    ASSERT_EQ(fs::read_symlink(root / "current"), root / "17.03.1-ce");
}

TEST_F(VersionDirectoryTest, reactivationSwitchesVersions)
{
    VersionDirectoryManager vdm(root);

    vdm.activate(root / "17.03.1-ce");
    vdm.activate(root / "17.03.0-ce");

    ASSERT_EQ(fs::read_symlink(root / "current"), root / "17.03.0-ce");
    ASSERT_FALSE(fs::exists(fs::symlink_status(root / ".current.tmp")));
}

TEST_F(VersionDirectoryTest, missingVersionFailsWithoutDanglingLink)
{
    VersionDirectoryManager vdm(root);

    ASSERT_THROW(vdm.activate(root / "99.0"), ProvisionError);
    ASSERT_FALSE(fs::exists(fs::symlink_status(root / "current")));
}

TEST_F(VersionDirectoryTest, missingVersionKeepsPreviousLink)
{
    VersionDirectoryManager vdm(root);
    vdm.activate(root / "17.03.1-ce");

    ASSERT_THROW(vdm.activate(root / "99.0"), ProvisionError);
    ASSERT_EQ(fs::read_symlink(root / "current"), root / "17.03.1-ce");
}

TEST_F(VersionDirectoryTest, refusesToReplaceRealDirectory)
{
    fs::create_directories(root / "current");
    VersionDirectoryManager vdm(root);

    ASSERT_THROW(vdm.activate(root / "17.03.1-ce"), ProvisionError);
    ASSERT_TRUE(fs::is_directory(fs::symlink_status(root / "current")));
}

TEST_F(VersionDirectoryTest, linkModeIsNeverFatal)
{
    VersionDirectoryManager vdm(root);
    vdm.activate(root / "17.03.1-ce");

    ASSERT_FALSE(vdm.last_link_mode_result().is_fatal());
}

TEST_F(VersionDirectoryTest, currentTargetIsEmptyWithoutLink)
{
    VersionDirectoryManager vdm(root);
    ASSERT_FALSE(vdm.current_target().has_value());
}

TEST_F(VersionDirectoryTest, listVersionsSkipsCurrentAndHidden)
{
    VersionDirectoryManager vdm(root);
    vdm.activate(root / "17.03.1-ce");
    fs::create_directories(root / ".partial");

    ASSERT_EQ(vdm.list_versions(), (std::vector<std::string>{"17.03.0-ce", "17.03.1-ce"}));
}

TEST(listVersions, emptyForMissingRoot)
{
    VersionDirectoryManager vdm("/nonexistent/rtprov/root");
    ASSERT_TRUE(vdm.list_versions().empty());
}

} // namespace rtprov
