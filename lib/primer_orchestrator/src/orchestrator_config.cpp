
#include <primer_common/common_conversions.h>
#include <primer_orchestrator/orchestrator_config.h>
#include <tempo_config/base_conversions.h>
#include <tempo_config/config_result.h>
#include <tempo_config/config_utils.h>
#include <tempo_config/container_conversions.h>
#include <tempo_config/parse_config.h>
#include <tempo_utils/file_reader.h>
#include <tempo_utils/log_stream.h>

static tempo_utils::Status
check_positive(int value, std::string_view key)
{
    if (value > 0)
        return {};
    return tempo_config::ConfigStatus::forCondition(tempo_config::ConfigCondition::kParseError,
        "invalid value {} for {}; must be positive", value, key);
}

/**
 * Parse the orchestrator configuration from the specified config map. Keys which are not
 * present take their default values. Relative lesson and lab paths are resolved against the
 * base directory if one is specified.
 *
 * @param configMap The config map.
 * @param baseDirectory The directory used to resolve relative paths.
 * @param orchestratorConfig The parsed configuration.
 * @return Ok status if parsing succeeded, otherwise notOk status.
 */
tempo_utils::Status
primer_orchestrator::parse_orchestrator_config(
    const tempo_config::ConfigMap &configMap,
    const std::filesystem::path &baseDirectory,
    OrchestratorConfig &orchestratorConfig)
{
    OrchestratorConfig defaults;

    tempo_config::PathParser lessonsRootParser(defaults.lessonsRoot);
    tempo_config::PathParser labRootParser(std::filesystem::path{});
    tempo_config::StringParser scriptExtensionParser(defaults.scriptExtension);
    primer_common::BackendTypeParser defaultBackendParser(defaults.defaultBackend);
    tempo_config::StringParser interpreterParser(defaults.interpreter);
    tempo_config::StringParser interpreterArgParser;
    tempo_config::SeqTParser interpreterArgsParser(&interpreterArgParser, {});
    tempo_config::IntegerParser localTimeoutParser(30);
    tempo_config::StringParser sandboxUrlParser(defaults.sandboxUrl);
    tempo_config::IntegerParser languageIdParser(defaults.languageId);
    tempo_config::IntegerParser requestTimeoutParser(30);
    tempo_config::IntegerParser healthCheckTimeoutParser(5);
    tempo_config::IntegerParser pollIntervalParser(1000);
    tempo_config::IntegerParser maxPollWaitParser(60);

    // determine the lessons root
    TU_RETURN_IF_NOT_OK (tempo_config::parse_config(orchestratorConfig.lessonsRoot,
        lessonsRootParser, configMap, "lessonsRoot"));

    // determine the lab root
    TU_RETURN_IF_NOT_OK (tempo_config::parse_config(orchestratorConfig.labRoot,
        labRootParser, configMap, "labRoot"));

    // determine the script extension
    TU_RETURN_IF_NOT_OK (tempo_config::parse_config(orchestratorConfig.scriptExtension,
        scriptExtensionParser, configMap, "scriptExtension"));

    // determine the default backend
    TU_RETURN_IF_NOT_OK (tempo_config::parse_config(orchestratorConfig.defaultBackend,
        defaultBackendParser, configMap, "defaultBackend"));

    // determine the local interpreter
    TU_RETURN_IF_NOT_OK (tempo_config::parse_config(orchestratorConfig.interpreter,
        interpreterParser, configMap, "interpreter"));

    // determine the arguments passed to the interpreter before the script path
    TU_RETURN_IF_NOT_OK (tempo_config::parse_config(orchestratorConfig.interpreterArgs,
        interpreterArgsParser, configMap, "interpreterArgs"));

    // parse the local timeout
    int localTimeoutSeconds;
    TU_RETURN_IF_NOT_OK (tempo_config::parse_config(localTimeoutSeconds,
        localTimeoutParser, configMap, "localTimeoutSeconds"));
    TU_RETURN_IF_NOT_OK (check_positive(localTimeoutSeconds, "localTimeoutSeconds"));
    orchestratorConfig.localTimeout = absl::Seconds(localTimeoutSeconds);

    // determine the sandbox url
    TU_RETURN_IF_NOT_OK (tempo_config::parse_config(orchestratorConfig.sandboxUrl,
        sandboxUrlParser, configMap, "sandboxUrl"));

    // determine the sandbox language id
    TU_RETURN_IF_NOT_OK (tempo_config::parse_config(orchestratorConfig.languageId,
        languageIdParser, configMap, "languageId"));

    // parse the sandbox request timeout
    int requestTimeoutSeconds;
    TU_RETURN_IF_NOT_OK (tempo_config::parse_config(requestTimeoutSeconds,
        requestTimeoutParser, configMap, "requestTimeoutSeconds"));
    TU_RETURN_IF_NOT_OK (check_positive(requestTimeoutSeconds, "requestTimeoutSeconds"));
    orchestratorConfig.requestTimeout = absl::Seconds(requestTimeoutSeconds);

    // parse the sandbox health check timeout
    int healthCheckTimeoutSeconds;
    TU_RETURN_IF_NOT_OK (tempo_config::parse_config(healthCheckTimeoutSeconds,
        healthCheckTimeoutParser, configMap, "healthCheckTimeoutSeconds"));
    TU_RETURN_IF_NOT_OK (check_positive(healthCheckTimeoutSeconds, "healthCheckTimeoutSeconds"));
    orchestratorConfig.healthCheckTimeout = absl::Seconds(healthCheckTimeoutSeconds);

    // parse the poll interval
    int pollIntervalMillis;
    TU_RETURN_IF_NOT_OK (tempo_config::parse_config(pollIntervalMillis,
        pollIntervalParser, configMap, "pollIntervalMillis"));
    TU_RETURN_IF_NOT_OK (check_positive(pollIntervalMillis, "pollIntervalMillis"));
    orchestratorConfig.pollInterval = absl::Milliseconds(pollIntervalMillis);

    // parse the maximum poll wait
    int maxPollWaitSeconds;
    TU_RETURN_IF_NOT_OK (tempo_config::parse_config(maxPollWaitSeconds,
        maxPollWaitParser, configMap, "maxPollWaitSeconds"));
    TU_RETURN_IF_NOT_OK (check_positive(maxPollWaitSeconds, "maxPollWaitSeconds"));
    orchestratorConfig.maxPollWait = absl::Seconds(maxPollWaitSeconds);

    // if base directory was specified then adjust relative paths

    if (!baseDirectory.empty()) {
        if (orchestratorConfig.lessonsRoot.is_relative()) {
            orchestratorConfig.lessonsRoot = baseDirectory / orchestratorConfig.lessonsRoot;
        }
        if (!orchestratorConfig.labRoot.empty() && orchestratorConfig.labRoot.is_relative()) {
            orchestratorConfig.labRoot = baseDirectory / orchestratorConfig.labRoot;
        }
    }

    return {};
}

/**
 * Load the orchestrator configuration from the specified file. Relative paths in the file are
 * resolved against the directory containing the file.
 *
 * @param configFile Path to the config file.
 * @return The parsed configuration.
 */
tempo_utils::Result<primer_orchestrator::OrchestratorConfig>
primer_orchestrator::load_orchestrator_config(const std::filesystem::path &configFile)
{
    tempo_utils::FileReader configReader(configFile);
    if (!configReader.isValid())
        return configReader.getStatus();
    auto configBytes = configReader.getBytes();
    std::string_view configString((const char *) configBytes->getData(), configBytes->getSize());

    tempo_config::ConfigNode configNode;
    TU_ASSIGN_OR_RETURN (configNode, tempo_config::read_config_string(configString));
    TU_LOG_V << "parsed orchestrator config: " << configNode.toString();

    if (configNode.getNodeType() != tempo_config::ConfigNodeType::kMap)
        return tempo_config::ConfigStatus::forCondition(tempo_config::ConfigCondition::kWrongType,
            "invalid type for orchestrator config {}; expected a map", configFile.string());

    OrchestratorConfig orchestratorConfig;
    auto baseDirectory = std::filesystem::absolute(configFile).parent_path();
    TU_RETURN_IF_NOT_OK (parse_orchestrator_config(configNode.toMap(), baseDirectory, orchestratorConfig));
    return orchestratorConfig;
}

primer_runner::RunnerOptions
primer_orchestrator::make_runner_options(const OrchestratorConfig &orchestratorConfig)
{
    primer_runner::RunnerOptions options;
    options.interpreter = orchestratorConfig.interpreter;
    options.interpreterArgs = orchestratorConfig.interpreterArgs;
    return options;
}

primer_sandbox::SandboxClientOptions
primer_orchestrator::make_sandbox_client_options(const OrchestratorConfig &orchestratorConfig)
{
    primer_sandbox::SandboxClientOptions options;
    options.baseUrl = orchestratorConfig.sandboxUrl;
    options.requestTimeout = orchestratorConfig.requestTimeout;
    options.healthCheckTimeout = orchestratorConfig.healthCheckTimeout;
    options.languageIds.insert(orchestratorConfig.languageId);
    return options;
}
