// =============================================================================
// railmr - Distributed MapReduce Runner for Sequencing Reads
// =============================================================================
// Main entry point for the railmr command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: run, exec-task, validate
// - Global options: verbose, quiet, log-file
// - Option files for `run` via --config (INI or TOML)
// =============================================================================

#include <CLI/CLI.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "railmr/backend/backend_config.h"
#include "railmr/common/error.h"
#include "railmr/common/logger.h"
#include "railmr/common/types.h"

// Command implementations
#include "commands/exec_task_command.h"
#include "commands/run_command.h"
#include "commands/validate_command.h"

namespace railmr::commands {
int runRun(CLI::App* app);
int runExecTask(CLI::App* app);
int runValidate(CLI::App* app);
}  // namespace railmr::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "railmr: run multi-stage MapReduce pipelines over sequencing reads\n"
    "on a local thread pool, a SLURM cluster, ssh hosts or an EMR cluster.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Run Command Options
// =============================================================================

struct CliRunOptions {
    std::string manifest;
    std::string pipeline = "dedup-count";
    std::vector<std::string> params;
    std::string backend = "local";
    std::uint32_t tasks = railmr::kDefaultTaskCount;

    std::string workRoot = "railmr-work";
    std::string output;
    std::string runId;
    std::uint32_t maxAttempts = railmr::kDefaultMaxAttempts;
    std::uint32_t maxUpstreamReruns = railmr::kDefaultMaxUpstreamReruns;
    std::int64_t pollIntervalMs = railmr::kDefaultPollInterval.count();
    std::int64_t retryBackoffMs = railmr::kDefaultRetryBackoff.count();
    std::string compression = "none";
    int compressionLevel = railmr::kDefaultCompressionLevel;
    std::size_t sortBufferMB = railmr::kDefaultSortBufferMB;
    std::int64_t claimTimeoutSec = railmr::kDefaultClaimTimeout.count();
    std::uint32_t submitRetries = 5;
    std::int64_t commandTimeoutSec = 60;
    bool noDedup = false;
    bool keepIntermediates = false;
    bool force = false;
    bool checkInputs = false;
    bool dryRun = false;
    bool noProgress = false;

    // local
    std::size_t workers = 0;

    // slurm
    std::string partition;
    std::string account;
    std::string timeLimit = "24:00:00";
    std::uint32_t memoryMb = 0;
    std::uint32_t cpusPerTask = 1;
    std::size_t maxQueued = 64;
    std::vector<std::string> sbatchArgs;

    // ssh
    std::string hosts;
    std::vector<std::string> sshOptions;

    // emr
    std::string clusterId;
    std::string region;
    std::string profile;
    std::size_t maxConcurrentSteps = 8;
    std::string actionOnFailure = "CONTINUE";
};

CliRunOptions gRunOpts;

// =============================================================================
// Exec-Task Command Options
// =============================================================================

struct CliExecTaskOptions {
    std::string descriptor;
    bool descriptorStdin = false;
};

CliExecTaskOptions gExecTaskOpts;

// =============================================================================
// Validate Command Options
// =============================================================================

struct CliValidateOptions {
    std::string manifest;
    std::string pipeline = "dedup-count";
    std::vector<std::string> params;
    std::uint32_t tasks = railmr::kDefaultTaskCount;
    bool checkInputs = false;
};

CliValidateOptions gValidateOpts;

// =============================================================================
// Validators
// =============================================================================

std::string checkBackendName(const std::string& name) {
    return railmr::backendKindFromString(name)
               ? std::string{}
               : "unknown backend '" + name + "' (local, slurm, ssh, emr)";
}

std::string checkCompressionName(const std::string& name) {
    return railmr::compressionFromString(name)
               ? std::string{}
               : "unknown compression '" + name + "' (none, gzip, zstd)";
}

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupRunCommand(CLI::App& app) {
    auto* run = app.add_subcommand("run", "Run a pipeline over a manifest");
    run->set_config("--config", "", "Read run options from an INI or TOML file");

    // Required options
    run->add_option("-m,--manifest", gRunOpts.manifest, "Manifest of input read files")
        ->required()
        ->check(CLI::ExistingFile);

    run->add_option("-p,--pipeline", gRunOpts.pipeline,
                    "Pipeline preset (dedup-count, collapse) or definition file")
        ->default_val("dedup-count");

    run->add_option("--param", gRunOpts.params, "Stage parameter key=value (repeatable)");

    run->add_option("-b,--backend", gRunOpts.backend, "Backend: local, slurm, ssh, emr")
        ->default_val("local")
        ->check(checkBackendName);

    run->add_option("-t,--tasks", gRunOpts.tasks, "Task count K for xK partition counts")
        ->default_val(railmr::kDefaultTaskCount)
        ->check(CLI::PositiveNumber);

    // Storage
    run->add_option("-w,--work-root", gRunOpts.workRoot, "Shared working storage root")
        ->default_val("railmr-work");
    run->add_option("-o,--output", gRunOpts.output, "Directory for merged final partitions");
    run->add_option("--run-id", gRunOpts.runId, "Run id (default: timestamp and pid)");
    run->add_flag("-f,--force", gRunOpts.force, "Replace an existing run with the same id");
    run->add_flag("--keep-intermediates", gRunOpts.keepIntermediates,
                  "Keep non-final stage outputs, cache and task files");

    // Execution
    run->add_option("--max-attempts", gRunOpts.maxAttempts, "Attempts per task")
        ->default_val(railmr::kDefaultMaxAttempts)
        ->check(CLI::Range(1, 100));
    run->add_option("--max-upstream-reruns", gRunOpts.maxUpstreamReruns,
                    "Re-runs of one upstream task after its outputs went missing")
        ->default_val(railmr::kDefaultMaxUpstreamReruns);
    run->add_option("--poll-interval", gRunOpts.pollIntervalMs, "Status poll interval in ms")
        ->default_val(railmr::kDefaultPollInterval.count())
        ->check(CLI::PositiveNumber);
    run->add_option("--retry-backoff", gRunOpts.retryBackoffMs,
                    "Initial delay before resubmitting a failed task, in ms")
        ->default_val(railmr::kDefaultRetryBackoff.count())
        ->check(CLI::NonNegativeNumber);
    run->add_option("--compression", gRunOpts.compression,
                    "Intermediate compression: none, gzip, zstd")
        ->default_val("none")
        ->check(checkCompressionName);
    run->add_option("--compression-level", gRunOpts.compressionLevel, "Compression level")
        ->default_val(railmr::kDefaultCompressionLevel)
        ->check(CLI::Range(1, 19));
    run->add_option("--sort-buffer", gRunOpts.sortBufferMB, "Sort buffer per task in MB")
        ->default_val(railmr::kDefaultSortBufferMB)
        ->check(CLI::PositiveNumber);
    run->add_option("--claim-timeout", gRunOpts.claimTimeoutSec,
                    "Seconds to wait on another task's cache claim")
        ->default_val(railmr::kDefaultClaimTimeout.count())
        ->check(CLI::PositiveNumber);
    run->add_option("--submit-retries", gRunOpts.submitRetries,
                    "Attempts of a failing backend client command")
        ->default_val(5)
        ->check(CLI::Range(1, 100));
    run->add_option("--command-timeout", gRunOpts.commandTimeoutSec,
                    "Timeout of one backend client command in seconds")
        ->default_val(60)
        ->check(CLI::PositiveNumber);
    run->add_flag("--no-dedup", gRunOpts.noDedup, "Disable redundancy elimination");
    run->add_flag("--check-inputs", gRunOpts.checkInputs, "Verify input files exist first");
    run->add_flag("-n,--dry-run", gRunOpts.dryRun, "Print the stage plan and exit");
    run->add_flag("--no-progress", gRunOpts.noProgress, "Disable per-task progress lines");

    // local
    run->add_option("--workers", gRunOpts.workers,
                    "Local worker threads (0 = NTASKS or hardware threads minus one)")
        ->group("local backend")
        ->default_val(0)
        ->check(CLI::Range(std::size_t{0}, railmr::kMaxLocalWorkers));

    // slurm
    run->add_option("--partition", gRunOpts.partition, "SLURM partition")
        ->group("slurm backend");
    run->add_option("--account", gRunOpts.account, "SLURM account")->group("slurm backend");
    run->add_option("--time-limit", gRunOpts.timeLimit, "SLURM time limit per task")
        ->group("slurm backend")
        ->default_val("24:00:00");
    run->add_option("--mem-mb", gRunOpts.memoryMb, "Memory per task in MB (0 = default)")
        ->group("slurm backend")
        ->default_val(0);
    run->add_option("--cpus-per-task", gRunOpts.cpusPerTask, "CPUs per task")
        ->group("slurm backend")
        ->default_val(1)
        ->check(CLI::PositiveNumber);
    run->add_option("--max-queued", gRunOpts.maxQueued, "Jobs queued or running at once")
        ->group("slurm backend")
        ->default_val(64)
        ->check(CLI::PositiveNumber);
    run->add_option("--sbatch-arg", gRunOpts.sbatchArgs, "Extra sbatch argument (repeatable)")
        ->group("slurm backend");

    // ssh
    run->add_option("--hosts", gRunOpts.hosts, "Hosts as host[:slots],host[:slots],...")
        ->group("ssh backend");
    run->add_option("--ssh-option", gRunOpts.sshOptions, "Extra ssh -o option (repeatable)")
        ->group("ssh backend");

    // emr
    run->add_option("--cluster-id", gRunOpts.clusterId, "EMR cluster id")->group("emr backend");
    run->add_option("--region", gRunOpts.region, "AWS region")->group("emr backend");
    run->add_option("--profile", gRunOpts.profile, "AWS profile")->group("emr backend");
    run->add_option("--max-concurrent-steps", gRunOpts.maxConcurrentSteps,
                    "Steps submitted at once")
        ->group("emr backend")
        ->default_val(8)
        ->check(CLI::PositiveNumber);
    run->add_option("--action-on-failure", gRunOpts.actionOnFailure, "Step ActionOnFailure")
        ->group("emr backend")
        ->default_val("CONTINUE")
        ->check(CLI::IsMember({"TERMINATE_CLUSTER", "CANCEL_AND_WAIT", "CONTINUE"}));
}

void setupExecTaskCommand(CLI::App& app) {
    auto* exec = app.add_subcommand("exec-task", "Run one task descriptor (worker entry)");

    auto* descriptor =
        exec->add_option("-d,--descriptor", gExecTaskOpts.descriptor, "Task descriptor file")
            ->check(CLI::ExistingFile);

    auto* fromStdin = exec->add_flag("--descriptor-stdin", gExecTaskOpts.descriptorStdin,
                                     "Read 'offset TAB path' split lines from stdin");

    descriptor->excludes(fromStdin);
    exec->require_option(1);
}

void setupValidateCommand(CLI::App& app) {
    auto* validate = app.add_subcommand("validate", "Validate a manifest and a pipeline");

    validate->add_option("-m,--manifest", gValidateOpts.manifest, "Manifest to check")
        ->check(CLI::ExistingFile);

    validate->add_option("-p,--pipeline", gValidateOpts.pipeline,
                         "Pipeline preset or definition file")
        ->default_val("dedup-count");

    validate->add_option("--param", gValidateOpts.params, "Stage parameter key=value");

    validate->add_option("-t,--tasks", gValidateOpts.tasks, "Task count for the printed plan")
        ->default_val(railmr::kDefaultTaskCount)
        ->check(CLI::PositiveNumber);

    validate->add_flag("--check-inputs", gValidateOpts.checkInputs,
                       "Verify input files exist");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    // Setup subcommands
    setupRunCommand(app);
    setupExecTaskCommand(app);
    setupValidateCommand(app);

    // Require a subcommand
    app.require_subcommand(1);

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        railmr::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.level = railmr::log::levelFromVerbosity(gOptions.verbosity, gOptions.quiet);
        if (app.got_subcommand("exec-task")) {
            logConfig.role = railmr::log::Role::kWorker;
            logConfig.appendToFile = true;
        }
        railmr::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    // Dispatch to subcommand handlers
    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("run")) {
            exitCode = railmr::commands::runRun(app.get_subcommand("run"));
        } else if (app.got_subcommand("exec-task")) {
            exitCode = railmr::commands::runExecTask(app.get_subcommand("exec-task"));
        } else if (app.got_subcommand("validate")) {
            exitCode = railmr::commands::runValidate(app.get_subcommand("validate"));
        }
    } catch (const railmr::RailmrException& ex) {
        RAILMR_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        RAILMR_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    railmr::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace railmr::commands {

int runRun([[maybe_unused]] CLI::App* app) {
    try {
        RunOptions opts;
        opts.manifestPath = gRunOpts.manifest;
        opts.pipeline = gRunOpts.pipeline;
        opts.params = parseParams(gRunOpts.params);
        opts.checkInputs = gRunOpts.checkInputs;
        opts.dryRun = gRunOpts.dryRun;
        opts.showProgress = !gRunOpts.noProgress && !gOptions.quiet;
        opts.quiet = gOptions.quiet;

        auto& job = opts.job;
        job.workRoot = gRunOpts.workRoot;
        job.runId = gRunOpts.runId;
        job.outputDir = gRunOpts.output;
        job.taskCount = gRunOpts.tasks;
        job.maxAttempts = gRunOpts.maxAttempts;
        job.maxUpstreamReruns = gRunOpts.maxUpstreamReruns;
        job.pollInterval = std::chrono::milliseconds{gRunOpts.pollIntervalMs};
        job.retryBackoff = std::chrono::milliseconds{gRunOpts.retryBackoffMs};
        job.compression = compressionFromString(gRunOpts.compression).value_or(Compression::kNone);
        job.compressionLevel = gRunOpts.compressionLevel;
        job.sortBufferMB = gRunOpts.sortBufferMB;
        job.claimTimeout = std::chrono::seconds{gRunOpts.claimTimeoutSec};
        job.dedup = !gRunOpts.noDedup;
        job.keepIntermediates = gRunOpts.keepIntermediates;
        job.force = gRunOpts.force;

        auto& backend = opts.backend;
        backend.kind = backendKindFromString(gRunOpts.backend).value_or(BackendKind::kLocal);
        backend.environment = backend::BackendEnvironment::capture();
        backend.submitRetry.maxAttempts = gRunOpts.submitRetries;
        backend.commandTimeout = std::chrono::seconds{gRunOpts.commandTimeoutSec};
        backend.local.workers = gRunOpts.workers;
        backend.scheduler.partition = gRunOpts.partition;
        backend.scheduler.account = gRunOpts.account;
        backend.scheduler.timeLimit = gRunOpts.timeLimit;
        backend.scheduler.memoryMb = gRunOpts.memoryMb;
        backend.scheduler.cpusPerTask = gRunOpts.cpusPerTask;
        backend.scheduler.maxQueued = gRunOpts.maxQueued;
        backend.scheduler.extraArgs = gRunOpts.sbatchArgs;
        if (!gRunOpts.hosts.empty()) {
            auto hosts = backend::RemoteShellOptions::parseHosts(gRunOpts.hosts);
            if (!hosts) {
                throw ConfigurationError(hosts.error().message());
            }
            backend.remoteShell.hosts = std::move(*hosts);
        }
        backend.remoteShell.sshOptions = gRunOpts.sshOptions;
        backend.elastic.clusterId = gRunOpts.clusterId;
        backend.elastic.region = gRunOpts.region;
        backend.elastic.profile = gRunOpts.profile;
        backend.elastic.maxConcurrentSteps = gRunOpts.maxConcurrentSteps;
        backend.elastic.actionOnFailure = gRunOpts.actionOnFailure;

        return createRunCommand(std::move(opts))->execute();
    } catch (const RailmrException& e) {
        RAILMR_LOG_ERROR("Run failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        RAILMR_LOG_ERROR("Unexpected error: {}", e.what());
        return EXIT_FAILURE;
    }
}

int runExecTask([[maybe_unused]] CLI::App* app) {
    try {
        ExecTaskOptions opts;
        opts.descriptorPath = gExecTaskOpts.descriptor;
        opts.fromStdin = gExecTaskOpts.descriptorStdin;
        return createExecTaskCommand(std::move(opts))->execute();
    } catch (const RailmrException& e) {
        RAILMR_LOG_ERROR("Task execution failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        RAILMR_LOG_ERROR("Unexpected error: {}", e.what());
        return EXIT_FAILURE;
    }
}

int runValidate([[maybe_unused]] CLI::App* app) {
    try {
        ValidateOptions opts;
        opts.manifestPath = gValidateOpts.manifest;
        opts.pipeline = gValidateOpts.pipeline;
        opts.params = gValidateOpts.params;
        opts.taskCount = gValidateOpts.tasks;
        opts.checkInputs = gValidateOpts.checkInputs;
        return createValidateCommand(std::move(opts))->execute();
    } catch (const RailmrException& e) {
        RAILMR_LOG_ERROR("Validation failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        RAILMR_LOG_ERROR("Unexpected error: {}", e.what());
        return EXIT_FAILURE;
    }
}

}  // namespace railmr::commands
