#include "rtprov/utils.hpp"
#include "rtprov/step_result.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

namespace rtprov {

/* ----------------------------------------------------------------------------
 * expand_tilde
 * --------------------------------------------------------------------------*/

TEST(expandTilde, expandsHome)
{
    const char * home = std::getenv("HOME");
    if (!home)
        GTEST_SKIP() << "HOME not set";

    ASSERT_EQ(expand_tilde("~/.rtprov"), std::filesystem::path(home) / ".rtprov");
    ASSERT_EQ(expand_tilde("~"), std::filesystem::path(home) / "");
}

TEST(expandTilde, leavesOtherPathsAlone)
{
    ASSERT_EQ(expand_tilde("/opt/docker"), "/opt/docker");
    ASSERT_EQ(expand_tilde("relative/path"), "relative/path");
    ASSERT_EQ(expand_tilde(""), "");
}

/* ----------------------------------------------------------------------------
 * substitute
 * --------------------------------------------------------------------------*/

TEST(substitute, replacesEveryOccurrence)
{
    ASSERT_EQ(
        substitute("https://h/{version}/docker-{version}.tgz", VERSION_PLACEHOLDER, "17.03.1-ce"),
        "https://h/17.03.1-ce/docker-17.03.1-ce.tgz");
}

TEST(substitute, valueContainingPlaceholderIsNotRescanned)
{
    ASSERT_EQ(substitute("{version}", VERSION_PLACEHOLDER, "{version}"), "{version}");
}

TEST(substitute, noPlaceholderIsUnchanged)
{
    ASSERT_EQ(substitute("https://h/latest.tgz", VERSION_PLACEHOLDER, "1.0"), "https://h/latest.tgz");
}

TEST(substitute, appliesToArgv)
{
    ASSERT_EQ(
        substitute_all({"dpkg", "-s", "{package}"}, PACKAGE_PLACEHOLDER, "daemon"),
        (std::vector<std::string>{"dpkg", "-s", "daemon"}));
}

/* ----------------------------------------------------------------------------
 * is_valid_version
 * --------------------------------------------------------------------------*/

TEST(isValidVersion, acceptsReleaseNames)
{
    ASSERT_TRUE(is_valid_version("17.03.1-ce"));
    ASSERT_TRUE(is_valid_version("1.13.0"));
    ASSERT_TRUE(is_valid_version("nightly"));
}

TEST(isValidVersion, rejectsPathsAndReservedNames)
{
    ASSERT_FALSE(is_valid_version(""));
    ASSERT_FALSE(is_valid_version("."));
    ASSERT_FALSE(is_valid_version(".."));
    ASSERT_FALSE(is_valid_version("current"));
    ASSERT_FALSE(is_valid_version("../etc"));
    ASSERT_FALSE(is_valid_version("a/b"));
    ASSERT_FALSE(is_valid_version(".current.tmp"));
    ASSERT_FALSE(is_valid_version(".17.03.1-ce"));
}

TEST(joinCommand, joinsWithSpaces)
{
    ASSERT_EQ(join_command({"daemon", "--", "/usr/bin/dockerd"}), "daemon -- /usr/bin/dockerd");
    ASSERT_EQ(join_command({}), "");
}

/* ----------------------------------------------------------------------------
 * StepResult
 * --------------------------------------------------------------------------*/

TEST(StepResult, factoriesSetStatus)
{
    ASSERT_EQ(StepResult::success("ok").status, StepStatus::SUCCESS);
    ASSERT_EQ(StepResult::nothing_to_do("skip").status, StepStatus::NOTHING_TO_DO);
    ASSERT_TRUE(StepResult::fatal("boom").is_fatal());
    ASSERT_FALSE(StepResult::nothing_to_do("skip").is_fatal());
    ASSERT_EQ(StepResult::fatal("boom").message, "boom");
}

TEST(StepResult, statusNames)
{
    ASSERT_EQ(status_to_string(StepStatus::SUCCESS), "success");
    ASSERT_EQ(status_to_string(StepStatus::NOTHING_TO_DO), "nothing_to_do");
    ASSERT_EQ(status_to_string(StepStatus::FATAL), "fatal");
}

} // namespace rtprov
