#include "rtprov/binary_exposer.hpp"
#include "rtprov/errors.hpp"
#include "rtprov/version_directory.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;

namespace rtprov {

using namespace rtprov::testing;

class BinaryExposerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        root = scratch / "docker";
        bin = scratch / "bin";
        fs::create_directories(bin);

        writeFile(root / "A" / "docker", "A-docker");
        writeFile(root / "A" / "docker-proxy", "A-proxy");
        writeFile(root / "B" / "docker", "B-docker");
        writeFile(root / "B" / "dockerd", "B-daemon");
        writeFile(root / "B" / "completion" / "docker.bash", "B-completion");
    }

    fs::path activate(const std::string & version)
    {
        VersionDirectoryManager vdm(root);
        return vdm.activate(root / version);
    }

    ScratchDir scratch;
    fs::path root;
    fs::path bin;
};

TEST_F(BinaryExposerTest, linksEveryRegularFileRecursively)
{
    auto current = activate("B");
    BinaryExposer exposer(bin);

    auto exposed = exposer.expose(current);

    ASSERT_EQ(exposed.size(), 3u);
    for (const auto & file : BinaryExposer::find_regular_files(current)) {
        auto link = bin / file.filename();
        ASSERT_TRUE(fs::is_symlink(link)) << link;
        ASSERT_EQ(fs::read_symlink(link), file);
        ASSERT_TRUE(fs::equivalent(link, file));
    }
}

TEST_F(BinaryExposerTest, linkTargetsAreSpelledThroughCurrent)
{
    auto current = activate("B");
    BinaryExposer exposer(bin);

    exposer.expose(current);

    ASSERT_EQ(fs::read_symlink(bin / "dockerd"), root / "current" / "dockerd");
    ASSERT_EQ(fs::read_symlink(bin / "docker.bash"), root / "current" / "completion" / "docker.bash");
}

TEST_F(BinaryExposerTest, laterVersionSupersedesSameName)
{
    BinaryExposer exposer(bin);

    exposer.expose(activate("A"));
    ASSERT_EQ(readFile(bin / "docker"), "A-docker");

    exposer.expose(activate("B"));
    ASSERT_EQ(readFile(bin / "docker"), "B-docker");
    ASSERT_EQ(fs::canonical(bin / "docker"), fs::canonical(root / "B" / "docker"));
}

TEST_F(BinaryExposerTest, orphanedLinksFromOlderVersionAreLeftAlone)
{
    BinaryExposer exposer(bin);

    exposer.expose(activate("A"));
    exposer.expose(activate("B"));

    // docker-proxy only exists in A; its link now dangles through current
    ASSERT_TRUE(fs::is_symlink(bin / "docker-proxy"));
    ASSERT_FALSE(fs::exists(bin / "docker-proxy"));
}

TEST_F(BinaryExposerTest, reExposingIsIdempotent)
{
    auto current = activate("B");
    BinaryExposer exposer(bin);

    auto first = exposer.expose(current);
    auto second = exposer.expose(current);

    ASSERT_EQ(first.size(), second.size());
    ASSERT_EQ(fs::read_symlink(bin / "docker"), root / "current" / "docker");
}

TEST_F(BinaryExposerTest, realFileInSearchPathStopsTheRun)
{
    writeFile(bin / "docker", "system docker");
    auto current = activate("B");
    BinaryExposer exposer(bin);

    try {
        exposer.expose(current);
        FAIL() << "expected ProvisionError";
    } catch (const ProvisionError & e) {
        ASSERT_EQ(e.step(), "expose");
        ASSERT_NE(std::string(e.what()).find("docker"), std::string::npos);
    }

    ASSERT_EQ(readFile(bin / "docker"), "system docker");
    // Files sorted after the failing one were not linked
    ASSERT_FALSE(fs::exists(fs::symlink_status(bin / "dockerd")));
}

TEST_F(BinaryExposerTest, missingSearchPathIsFatal)
{
    auto current = activate("B");
    BinaryExposer exposer(scratch / "no-such-bin");

    ASSERT_THROW(exposer.expose(current), ProvisionError);
}

TEST_F(BinaryExposerTest, unreadableTreeIsFatal)
{
    BinaryExposer exposer(bin);
    ASSERT_THROW(exposer.expose(root / "current"), ProvisionError);
}

TEST_F(BinaryExposerTest, symlinksInsideReleaseAreNotExposed)
{
    fs::create_symlink(root / "B" / "docker", root / "B" / "docker-alias");
    auto current = activate("B");
    BinaryExposer exposer(bin);

    exposer.expose(current);

    ASSERT_FALSE(fs::exists(fs::symlink_status(bin / "docker-alias")));
}

TEST_F(BinaryExposerTest, listExposedReportsLinksIntoCurrent)
{
    auto current = activate("B");
    BinaryExposer exposer(bin);
    exposer.expose(current);
    fs::create_symlink("/bin/sh", bin / "sh");

    auto listed = exposer.list_exposed(current);

    ASSERT_EQ(listed.size(), 3u);
    ASSERT_EQ(listed[0].link, bin / "docker");
    ASSERT_EQ(listed[1].link, bin / "docker.bash");
    ASSERT_EQ(listed[2].link, bin / "dockerd");
}

} // namespace rtprov
