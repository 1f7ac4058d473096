/**
 * @file provisioner.hpp
 * @brief Sequences a complete provisioning run
 *
 * This header defines the orchestrator that drives the seven stages of a
 * run, in order:
 *
 * 1. prerequisites       - external prerequisite installer
 * 2. supervisor_package  - make sure the supervising wrapper is installed
 * 3. fetch               - download/extract the release (skipped if present)
 * 4. activate            - point <root>/current at the release (always)
 * 5. expose              - link the release's files into the search path (always)
 * 6. restart             - kill the old daemon, launch the new one (always)
 * 7. configure           - external post-install configuration
 *
 * The first fatal stage aborts the run. Nothing is rolled back: the host
 * stays in an intermediate but re-runnable state and the supported
 * recovery is to run again from the start.
 *
 * The orchestrator coordinates between:
 * - StateMachine: to enforce the stage order
 * - AuditLogger: to record every stage and outcome
 * - the components and external collaborators listed above
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <filesystem>
#include <nlohmann/json.hpp>

#include "rtprov/state_machine.hpp"
#include "rtprov/step_result.hpp"
#include "rtprov/binary_exposer.hpp"
#include "rtprov/config_manager.hpp"

namespace rtprov {

    class IExternalStep;
    class IPackageManager;
    class ArtifactFetcher;
    class VersionDirectoryManager;
    class ProcessSupervisor;
    class AuditLogger;

    /**
     * @brief Outcome of one stage in the report
     */
    struct StepRecord {
        Stage stage;
        StepResult result;
    };

    /**
     * @brief What a run did, stage by stage
     *
     * Filled in as the run progresses, so a failed run still reports the
     * stages that completed before the failure.
     */
    struct ProvisionReport {
        std::string version;
        std::filesystem::path version_dir;
        std::filesystem::path current_link;
        std::vector<ExposedBinary> exposed;
        std::vector<StepRecord> steps;
        Stage final_stage = Stage::IDLE;
        std::string error;                 ///< Empty unless the run failed
    };

    void to_json(nlohmann::json& j, const ProvisionReport& report);

    /**
     * @brief Drives one provisioning run
     *
     * A Provisioner instance performs a single run; construct a new one to
     * run again.
     *
     * Thread safety:
     * - Not thread-safe, stages run one after another
     */
    class Provisioner {
    public:
        /**
         * @brief Constructs the orchestrator with its collaborators
         *
         * @param config Normalized, validated configuration
         * @param prerequisites External prerequisite installer
         * @param packages Package manager used for the supervising wrapper
         * @param fetcher Artifact fetcher
         * @param versions Version directory manager for config.install_root
         * @param exposer Binary exposer for config.search_path_dir
         * @param supervisor Process supervisor trigger
         * @param configuration External post-install configuration
         * @param audit_logger Audit log sink
         */
        Provisioner(const ProvisionConfig& config,
                    IExternalStep& prerequisites,
                    IPackageManager& packages,
                    ArtifactFetcher& fetcher,
                    VersionDirectoryManager& versions,
                    BinaryExposer& exposer,
                    ProcessSupervisor& supervisor,
                    IExternalStep& configuration,
                    AuditLogger& audit_logger);

        /**
         * @brief Runs all stages in order
         *
         * @return ProvisionReport Report of a completed run
         * @throws ProvisionError naming the first stage that failed;
         *         get_report() then describes the partial run
         */
        ProvisionReport run();

        [[nodiscard]] const ProvisionReport& get_report() const { return report_; }

        [[nodiscard]] Stage get_stage() const { return state_machine_.get_stage(); }

    private:
        /**
         * @brief Enters a stage, runs its action and records the outcome
         *
         * Exceptions from the action and FATAL results both mark the run
         * FAILED and propagate as ProvisionError.
         */
        void run_stage(Stage stage, const std::function<StepResult()>& action);

        void fail(Stage stage, const std::string& message);

        StepResult stage_prerequisites();
        StepResult stage_supervisor_package();
        StepResult stage_fetch();
        StepResult stage_activate();
        StepResult stage_expose();
        StepResult stage_restart();
        StepResult stage_configure();

        const ProvisionConfig& config_;
        IExternalStep& prerequisites_;
        IPackageManager& packages_;
        ArtifactFetcher& fetcher_;
        VersionDirectoryManager& versions_;
        BinaryExposer& exposer_;
        ProcessSupervisor& supervisor_;
        IExternalStep& configuration_;
        AuditLogger& audit_logger_;

        StateMachine state_machine_;
        ProvisionReport report_;
    };

} // namespace rtprov
