#include "rtprov/provisioner.hpp"
#include "rtprov/artifact_fetcher.hpp"
#include "rtprov/audit_logger.hpp"
#include "rtprov/errors.hpp"
#include "rtprov/external_step.hpp"
#include "rtprov/process_supervisor.hpp"
#include "rtprov/version_directory.hpp"
#include <iostream>

namespace rtprov {

    void to_json(nlohmann::json& j, const ProvisionReport& report) {
        nlohmann::json steps = nlohmann::json::array();
        for (const auto& record : report.steps) {
            steps.push_back({
                {"stage", stage_to_string(record.stage)},
                {"status", status_to_string(record.result.status)},
                {"message", record.result.message}
            });
        }

        nlohmann::json exposed = nlohmann::json::array();
        for (const auto& binary : report.exposed) {
            exposed.push_back({
                {"link", binary.link.string()},
                {"target", binary.target.string()}
            });
        }

        j = nlohmann::json{
            {"version", report.version},
            {"version_dir", report.version_dir.string()},
            {"current_link", report.current_link.string()},
            {"exposed", exposed},
            {"steps", steps},
            {"stage", stage_to_string(report.final_stage)},
            {"error", report.error.empty() ? nlohmann::json(nullptr) : nlohmann::json(report.error)}
        };
    }

    Provisioner::Provisioner(const ProvisionConfig& config,
                             IExternalStep& prerequisites,
                             IPackageManager& packages,
                             ArtifactFetcher& fetcher,
                             VersionDirectoryManager& versions,
                             BinaryExposer& exposer,
                             ProcessSupervisor& supervisor,
                             IExternalStep& configuration,
                             AuditLogger& audit_logger)
        : config_(config)
        , prerequisites_(prerequisites)
        , packages_(packages)
        , fetcher_(fetcher)
        , versions_(versions)
        , exposer_(exposer)
        , supervisor_(supervisor)
        , configuration_(configuration)
        , audit_logger_(audit_logger) {
        report_.version = config_.version;
    }

    ProvisionReport Provisioner::run() {
        audit_logger_.log_info("Provisioning release " + config_.version +
                               " into " + config_.install_root.string());

        run_stage(Stage::PREREQUISITES, [this] { return stage_prerequisites(); });
        run_stage(Stage::SUPERVISOR_PACKAGE, [this] { return stage_supervisor_package(); });
        run_stage(Stage::FETCH, [this] { return stage_fetch(); });
        run_stage(Stage::ACTIVATE, [this] { return stage_activate(); });
        run_stage(Stage::EXPOSE, [this] { return stage_expose(); });
        run_stage(Stage::RESTART, [this] { return stage_restart(); });
        run_stage(Stage::CONFIGURE, [this] { return stage_configure(); });

        state_machine_.transition_to(Stage::DONE);
        report_.final_stage = Stage::DONE;

        audit_logger_.log_success("Provisioning complete", config_.version);
        return report_;
    }

    void Provisioner::run_stage(Stage stage, const std::function<StepResult()>& action) {
        const std::string name = stage_to_string(stage);

        if (!state_machine_.transition_to(stage)) {
            throw ProvisionError(name, "Stage entered out of order after " +
                                       stage_to_string(state_machine_.get_stage()));
        }
        report_.final_stage = stage;

        std::cout << "==> " << name << std::endl;
        audit_logger_.log_step(name);

        StepResult result;
        try {
            result = action();
        } catch (const ProvisionError& e) {
            fail(stage, e.detail());
            throw;
        } catch (const std::exception& e) {
            fail(stage, e.what());
            throw ProvisionError(name, e.what());
        }

        if (result.is_fatal()) {
            fail(stage, result.message);
            throw ProvisionError(name, result.message);
        }

        report_.steps.push_back({stage, result});

        if (result.status == StepStatus::NOTHING_TO_DO) {
            audit_logger_.log_skip(name, result.message);
        } else {
            audit_logger_.log_success(name, result.message);
        }
    }

    void Provisioner::fail(Stage stage, const std::string& message) {
        report_.steps.push_back({stage, StepResult::fatal(message)});
        report_.error = "[" + stage_to_string(stage) + "] " + message;
        report_.final_stage = Stage::FAILED;
        state_machine_.transition_to(Stage::FAILED);
        audit_logger_.log_error(message, stage_to_string(stage));
    }

    StepResult Provisioner::stage_prerequisites() {
        return prerequisites_.run();
    }

    StepResult Provisioner::stage_supervisor_package() {
        return packages_.ensure_package(config_.supervisor_package);
    }

    StepResult Provisioner::stage_fetch() {
        report_.version_dir = fetcher_.fetch(config_.version, config_.url_template, config_.install_root);

        if (fetcher_.last_fetch_skipped()) {
            return StepResult::nothing_to_do("Release " + config_.version + " already present in " +
                                             report_.version_dir.string());
        }
        audit_logger_.log_action("Fetched release", report_.version_dir.string());
        return StepResult::success("Fetched release " + config_.version + " into " +
                                   report_.version_dir.string());
    }

    StepResult Provisioner::stage_activate() {
        auto previous = versions_.current_target();

        report_.current_link = versions_.activate(report_.version_dir);
        audit_logger_.log_action("Current link", report_.current_link.string() + " -> " +
                                 report_.version_dir.string());

        const StepResult& link_mode = versions_.last_link_mode_result();
        if (link_mode.status == StepStatus::NOTHING_TO_DO) {
            audit_logger_.log_skip("Link mode", link_mode.message);
        }

        if (previous && previous == versions_.current_target()) {
            return StepResult::success("Release " + config_.version + " was already active, link refreshed");
        }
        return StepResult::success("Activated release " + config_.version);
    }

    StepResult Provisioner::stage_expose() {
        report_.exposed = exposer_.expose(report_.current_link);

        for (const auto& binary : report_.exposed) {
            audit_logger_.log_action("Linked", binary.link.string() + " -> " + binary.target.string());
        }
        return StepResult::success("Linked " + std::to_string(report_.exposed.size()) +
                                   " binaries into " + exposer_.get_search_path_dir().string());
    }

    StepResult Provisioner::stage_restart() {
        StepResult terminated = supervisor_.restart_daemon(config_.daemon_binary);

        if (terminated.status == StepStatus::NOTHING_TO_DO) {
            audit_logger_.log_skip("Terminate daemon", terminated.message);
        } else {
            audit_logger_.log_action("Terminate daemon", terminated.message);
        }
        audit_logger_.log_action("Launched daemon", config_.daemon_binary.string());

        return StepResult::success(terminated.message + "; launched " + config_.daemon_binary.string() +
                                   " under " + supervisor_.get_settings().wrapper);
    }

    StepResult Provisioner::stage_configure() {
        return configuration_.run();
    }

} // namespace rtprov
