#ifndef PRIMER_ORCHESTRATOR_ORCHESTRATOR_CONFIG_H
#define PRIMER_ORCHESTRATOR_ORCHESTRATOR_CONFIG_H

#include <filesystem>
#include <vector>

#include <absl/time/time.h>

#include <primer_common/execution_types.h>
#include <primer_runner/local_runner.h>
#include <primer_sandbox/sandbox_client.h>
#include <tempo_config/config_types.h>
#include <tempo_utils/result.h>

namespace primer_orchestrator {

    struct OrchestratorConfig {
        std::filesystem::path lessonsRoot = "lessons";
        std::filesystem::path labRoot = {};
        std::string scriptExtension = ".py";
        primer_common::BackendType defaultBackend = primer_common::BackendType::Local;
        std::string interpreter = primer_runner::kDefaultInterpreter;
        std::vector<std::string> interpreterArgs = {};
        absl::Duration localTimeout = absl::Seconds(30);
        std::string sandboxUrl = primer_sandbox::kDefaultSandboxUrl;
        int languageId = primer_sandbox::kPythonLanguageId;
        absl::Duration requestTimeout = absl::Seconds(30);
        absl::Duration healthCheckTimeout = absl::Seconds(5);
        absl::Duration pollInterval = absl::Seconds(1);
        absl::Duration maxPollWait = absl::Seconds(60);
    };

    tempo_utils::Status parse_orchestrator_config(
        const tempo_config::ConfigMap &configMap,
        const std::filesystem::path &baseDirectory,
        OrchestratorConfig &orchestratorConfig);

    tempo_utils::Result<OrchestratorConfig> load_orchestrator_config(const std::filesystem::path &configFile);

    primer_runner::RunnerOptions make_runner_options(const OrchestratorConfig &orchestratorConfig);

    primer_sandbox::SandboxClientOptions make_sandbox_client_options(const OrchestratorConfig &orchestratorConfig);
}

#endif // PRIMER_ORCHESTRATOR_ORCHESTRATOR_CONFIG_H
