#include "rtprov/external_step.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace rtprov {

using namespace rtprov::testing;

using Argv = std::vector<std::string>;

/* ----------------------------------------------------------------------------
 * CommandStep
 * --------------------------------------------------------------------------*/

TEST(CommandStep, emptyCommandHasNothingToDo)
{
    RecordingCommandRunner runner;
    CommandStep step(runner, "configuration", {});

    ASSERT_EQ(step.run().status, StepStatus::NOTHING_TO_DO);
    ASSERT_TRUE(runner.calls.empty());
}

TEST(CommandStep, zeroExitIsSuccess)
{
    RecordingCommandRunner runner;
    CommandStep step(runner, "prerequisites", {"/usr/local/sbin/prereqs", "--quiet"});

    ASSERT_EQ(step.run().status, StepStatus::SUCCESS);
    ASSERT_EQ(runner.calls, (std::vector<Argv>{{"/usr/local/sbin/prereqs", "--quiet"}}));
}

TEST(CommandStep, nonZeroExitIsFatal)
{
    RecordingCommandRunner runner;
    runner.handler = [](const Argv &) { return 3; };
    CommandStep step(runner, "configuration", {"configure-docker"});

    auto result = step.run();

    ASSERT_TRUE(result.is_fatal());
    ASSERT_NE(result.message.find("status 3"), std::string::npos);
}

/* ----------------------------------------------------------------------------
 * CommandPackageManager
 * --------------------------------------------------------------------------*/

TEST(CommandPackageManager, installedPackageHasNothingToDo)
{
    RecordingCommandRunner runner;
    CommandPackageManager packages(runner, {"dpkg", "-s", "{package}"}, {"apt-get", "install", "-y", "{package}"});

    ASSERT_EQ(packages.ensure_package("daemon").status, StepStatus::NOTHING_TO_DO);
    ASSERT_EQ(runner.calls, (std::vector<Argv>{{"dpkg", "-s", "daemon"}}));
}

TEST(CommandPackageManager, missingPackageIsInstalled)
{
    RecordingCommandRunner runner;
    runner.handler = [](const Argv & argv) { return argv[0] == "dpkg" ? 1 : 0; };
    CommandPackageManager packages(runner, {"dpkg", "-s", "{package}"}, {"apt-get", "install", "-y", "{package}"});

    ASSERT_EQ(packages.ensure_package("daemon").status, StepStatus::SUCCESS);
    ASSERT_EQ(runner.calls.size(), 2u);
    ASSERT_EQ(runner.calls[1], (Argv{"apt-get", "install", "-y", "daemon"}));
}

TEST(CommandPackageManager, failedInstallIsFatal)
{
    RecordingCommandRunner runner;
    runner.handler = [](const Argv &) { return 100; };
    CommandPackageManager packages(runner, {"dpkg", "-s", "{package}"}, {"apt-get", "install", "-y", "{package}"});

    ASSERT_TRUE(packages.ensure_package("daemon").is_fatal());
}

TEST(CommandPackageManager, missingPackageWithoutInstallCommandIsFatal)
{
    RecordingCommandRunner runner;
    runner.handler = [](const Argv &) { return 1; };
    CommandPackageManager packages(runner, {"rpm", "-q", "{package}"}, {});

    ASSERT_TRUE(packages.ensure_package("daemon").is_fatal());
}

} // namespace rtprov
