#include "rtprov/config_manager.hpp"
#include "rtprov/errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;

namespace rtprov {

using namespace rtprov::testing;

/* ----------------------------------------------------------------------------
 * parse / load
 * --------------------------------------------------------------------------*/

TEST(ConfigManager, emptyObjectGivesDockerDefaults)
{
    auto config = ConfigManager::parse("{}");

    ASSERT_EQ(config.version, "");
    ASSERT_EQ(config.url_template, "https://get.docker.com/builds/Linux/x86_64/docker-{version}.tgz");
    ASSERT_EQ(config.install_root, "/opt/docker");
    ASSERT_EQ(config.search_path_dir, "/usr/bin");
    ASSERT_EQ(config.entry_point, "docker");
    ASSERT_EQ(config.daemon_binary, "dockerd");
    ASSERT_EQ(config.supervisor_wrapper, "daemon");
    ASSERT_EQ(config.kill_command, "killall");
    ASSERT_TRUE(config.prerequisites_command.empty());
    ASSERT_TRUE(config.configure_command.empty());
}

TEST(ConfigManager, fileValuesOverrideDefaults)
{
    auto config = ConfigManager::parse(R"({
        "version": "17.03.1-ce",
        "install_root": "/srv/docker",
        "configure_command": ["/usr/local/sbin/docker-configure", "--tls"],
        "process_name": "docker"
    })");

    ASSERT_EQ(config.version, "17.03.1-ce");
    ASSERT_EQ(config.install_root, "/srv/docker");
    ASSERT_EQ(config.configure_command, (std::vector<std::string>{"/usr/local/sbin/docker-configure", "--tls"}));
    ASSERT_EQ(config.process_name, "docker");
    ASSERT_EQ(config.search_path_dir, "/usr/bin");
}

TEST(ConfigManager, malformedJsonIsConfigError)
{
    ASSERT_THROW((void) ConfigManager::parse("{ \"version\": "), ConfigError);
}

TEST(ConfigManager, nonObjectIsConfigError)
{
    ASSERT_THROW((void) ConfigManager::parse("[\"17.03.1-ce\"]"), ConfigError);
}

TEST(ConfigManager, wronglyTypedValueIsConfigError)
{
    ASSERT_THROW((void) ConfigManager::parse(R"({"configure_command": "configure.sh"})"), ConfigError);
}

TEST(ConfigManager, loadsFile)
{
    ScratchDir scratch;
    writeFile(scratch / "rtprov.json", R"({"version": "1.13.0", "entry_point": "docker-1.13"})");

    auto config = ConfigManager::load((scratch / "rtprov.json").string());

    ASSERT_EQ(config.version, "1.13.0");
    ASSERT_EQ(config.entry_point, "docker-1.13");
}

TEST(ConfigManager, missingFileIsConfigError)
{
    ScratchDir scratch;
    ASSERT_THROW((void) ConfigManager::load((scratch / "absent.json").string()), ConfigError);
}

TEST(ConfigManager, loadErrorNamesFile)
{
    ScratchDir scratch;
    writeFile(scratch / "broken.json", "not json");

    try {
        (void) ConfigManager::load((scratch / "broken.json").string());
        FAIL() << "expected ConfigError";
    } catch (const ConfigError & e) {
        ASSERT_NE(std::string(e.what()).find("broken.json"), std::string::npos);
    }
}

TEST(ConfigManager, serializesBackToJson)
{
    auto config = ConfigManager::parse(R"({"version": "17.03.1-ce"})");

    nlohmann::json j = config;
    auto reparsed = ConfigManager::parse(j.dump());

    ASSERT_EQ(reparsed.version, "17.03.1-ce");
    ASSERT_EQ(reparsed.package_install_command, config.package_install_command);
}

/* ----------------------------------------------------------------------------
 * overrides / normalize / validate
 * --------------------------------------------------------------------------*/

TEST(ConfigManager, overridesReplaceOnlyWhatIsSet)
{
    auto config = ConfigManager::parse(R"({"version": "1.13.0", "install_root": "/srv/docker"})");

    ConfigOverrides overrides;
    overrides.version = "17.03.1-ce";
    overrides.search_path_dir = "/usr/local/bin";
    ConfigManager::apply_overrides(config, overrides);

    ASSERT_EQ(config.version, "17.03.1-ce");
    ASSERT_EQ(config.install_root, "/srv/docker");
    ASSERT_EQ(config.search_path_dir, "/usr/local/bin");
}

TEST(ConfigManager, normalizeResolvesDaemonUnderSearchPath)
{
    ProvisionConfig config;
    config.search_path_dir = "/usr/local/bin/";
    config.install_root = "/opt/docker/";
    config.log_dir = "/tmp/rtprov-logs";

    ConfigManager::normalize(config);

    ASSERT_EQ(config.search_path_dir, "/usr/local/bin");
    ASSERT_EQ(config.install_root, "/opt/docker");
    ASSERT_EQ(config.daemon_binary, "/usr/local/bin/dockerd");
    ASSERT_EQ(config.log_dir, "/tmp/rtprov-logs");
}

TEST(ConfigManager, normalizeKeepsAbsoluteDaemon)
{
    ProvisionConfig config;
    config.daemon_binary = "/opt/docker/current/dockerd";

    ConfigManager::normalize(config);

    ASSERT_EQ(config.daemon_binary, "/opt/docker/current/dockerd");
    ASSERT_FALSE(config.log_dir.empty());
}

TEST(ConfigManager, normalizeMakesRootsAbsolute)
{
    ProvisionConfig config;
    config.install_root = "relative/docker";

    ConfigManager::normalize(config);

    ASSERT_TRUE(config.install_root.is_absolute());
    ASSERT_EQ(config.install_root.filename(), "docker");
}

TEST(ConfigManager, validateRequiresVersion)
{
    ProvisionConfig config;
    ConfigManager::normalize(config);

    ASSERT_THROW(ConfigManager::validate(config), ConfigError);

    config.version = "17.03.1-ce";
    ASSERT_NO_THROW(ConfigManager::validate(config));
}

TEST(ConfigManager, validateRejectsUnusableValues)
{
    ProvisionConfig config;
    config.version = "17.03.1-ce";
    ConfigManager::normalize(config);

    auto broken = config;
    broken.version = "../escape";
    ASSERT_THROW(ConfigManager::validate(broken), ConfigError);

    broken = config;
    broken.url_template = "https://get.docker.com/docker-latest.tgz";
    ASSERT_THROW(ConfigManager::validate(broken), ConfigError);

    broken = config;
    broken.entry_point = "";
    ASSERT_THROW(ConfigManager::validate(broken), ConfigError);

    broken = config;
    broken.supervisor_wrapper = "";
    ASSERT_THROW(ConfigManager::validate(broken), ConfigError);
}

} // namespace rtprov
