
#include <algorithm>

#include <absl/container/flat_hash_set.h>
#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>

#include <primer_common/primer_result.h>
#include <primer_orchestrator/execution_orchestrator.h>
#include <primer_orchestrator/lesson_resolver.h>
#include <primer_runner/local_runner.h>
#include <primer_sandbox/sandbox_client.h>
#include <tempo_utils/file_reader.h>
#include <tempo_utils/log_stream.h>

static const char *
dispatch_state_to_string(primer_orchestrator::DispatchState state)
{
    switch (state) {
        case primer_orchestrator::DispatchState::Pending:
            return "Pending";
        case primer_orchestrator::DispatchState::Dispatched:
            return "Dispatched";
        case primer_orchestrator::DispatchState::Finished:
            return "Finished";
    }
    TU_UNREACHABLE();
}

// lower bound on the request timeout of a poll made when the deadline has nearly passed
constexpr absl::Duration kMinimumPollTimeout = absl::Milliseconds(100);

static bool
has_condition(const tempo_utils::Status &status, primer_common::PrimerCondition condition)
{
    primer_common::PrimerStatus primerStatus;
    if (!status.convertTo(primerStatus))
        return false;
    return primerStatus.getCondition() == condition;
}

primer_orchestrator::ExecutionOrchestrator::ExecutionOrchestrator(
    const OrchestratorConfig &config,
    std::shared_ptr<AbstractLessonResolver> resolver,
    std::shared_ptr<primer_runner::AbstractLocalRunner> localRunner,
    std::shared_ptr<primer_sandbox::AbstractSandboxClient> sandboxClient)
    : m_config(config),
      m_resolver(std::move(resolver)),
      m_localRunner(std::move(localRunner)),
      m_sandboxClient(std::move(sandboxClient))
{
    TU_ASSERT (m_resolver != nullptr);
    TU_ASSERT (m_localRunner != nullptr);
    TU_ASSERT (m_sandboxClient != nullptr);
    TU_ASSERT (m_config.pollInterval > absl::ZeroDuration());
}

/**
 * Construct an orchestrator which resolves lessons from the configured lessons directory, runs
 * local lessons with the configured interpreter, and submits remote lessons to the configured
 * sandbox service.
 *
 * @param config The orchestrator configuration.
 * @return The orchestrator.
 */
std::shared_ptr<primer_orchestrator::ExecutionOrchestrator>
primer_orchestrator::ExecutionOrchestrator::create(const OrchestratorConfig &config)
{
    auto resolver = std::make_shared<DirectoryLessonResolver>(
        config.lessonsRoot, config.labRoot, config.scriptExtension);
    auto localRunner = std::make_shared<primer_runner::LocalRunner>(make_runner_options(config));
    auto sandboxClient = std::make_shared<primer_sandbox::SandboxClient>(make_sandbox_client_options(config));
    return std::make_shared<ExecutionOrchestrator>(config, resolver, localRunner, sandboxClient);
}

primer_orchestrator::OrchestratorConfig
primer_orchestrator::ExecutionOrchestrator::getConfig() const
{
    return m_config;
}

tempo_utils::Result<primer_common::ExecutionResult>
primer_orchestrator::ExecutionOrchestrator::executeLesson(
    std::string_view category,
    std::string_view name,
    primer_common::BackendType backend)
{
    return execute(primer_common::ExecutionRequest(category, name, backend));
}

tempo_utils::Result<primer_common::ExecutionResult>
primer_orchestrator::ExecutionOrchestrator::executeLesson(
    std::string_view category,
    std::string_view name)
{
    return execute(primer_common::ExecutionRequest(category, name, m_config.defaultBackend));
}

/**
 * Execute the lesson identified by the request. Exactly one history entry is appended for every
 * call, whatever the outcome. Operational failures are reported in the result status, and only
 * unexpected conditions are returned as a notOk status.
 *
 * @param request The execution request.
 * @return The execution result.
 */
tempo_utils::Result<primer_common::ExecutionResult>
primer_orchestrator::ExecutionOrchestrator::execute(const primer_common::ExecutionRequest &request)
{
    TU_ASSERT (request.isValid());
    auto lessonId = request.getLessonId();
    auto startTime = absl::Now();
    TU_LOG_V << "lesson " << lessonId << " is " << dispatch_state_to_string(DispatchState::Pending);

    primer_common::ExecutionResult result;

    auto requestTimeout = request.getTimeout();
    if (!requestTimeout.isEmpty() && requestTimeout.getValue() <= absl::ZeroDuration()) {
        result = primer_common::ExecutionResult::failed({}, {}, {}, absl::Now() - startTime,
            request.getBackend(), absl::StrCat("invalid timeout ",
                absl::FormatDuration(requestTimeout.getValue()), "; timeout must be positive"));
        TU_LOG_WARN << "rejected lesson " << lessonId << ": " << result.getMessage();
        appendHistory(request, result);
        return result;
    }

    auto resolveLessonResult = m_resolver->resolveLesson(request.getCategory(), request.getName());
    if (resolveLessonResult.isResult()) {
        auto scriptPath = resolveLessonResult.getResult();
        TU_LOG_V << "lesson " << lessonId << " is " << dispatch_state_to_string(DispatchState::Dispatched);
        auto dispatchResult = dispatch(request, scriptPath);
        if (dispatchResult.isStatus()) {
            auto status = dispatchResult.getStatus();
            TU_LOG_ERROR << "execution of lesson " << lessonId << " failed: " << status;
            appendHistory(request, primer_common::ExecutionResult::failed({}, {}, {},
                absl::Now() - startTime, request.getBackend(), status.getMessage()));
            return status;
        }
        result = dispatchResult.getResult();
    } else {
        auto status = resolveLessonResult.getStatus();
        if (!has_condition(status, primer_common::PrimerCondition::kLessonNotFound)) {
            TU_LOG_ERROR << "failed to resolve lesson " << lessonId << ": " << status;
            appendHistory(request, primer_common::ExecutionResult::failed({}, {}, {},
                absl::Now() - startTime, request.getBackend(), status.getMessage()));
            return status;
        }
        result = primer_common::ExecutionResult::failed({}, {}, {}, absl::Now() - startTime,
            request.getBackend(), absl::StrCat("lesson not found: ", status.getMessage()));
    }

    TU_LOG_INFO << "lesson " << lessonId << " is " << dispatch_state_to_string(DispatchState::Finished)
        << " with status " << primer_common::execution_status_to_string(result.getStatus())
        << " on " << primer_common::backend_type_to_string(result.getBackendUsed()) << " backend";

    appendHistory(request, result);
    return result;
}

tempo_utils::Result<primer_common::ExecutionResult>
primer_orchestrator::ExecutionOrchestrator::dispatch(
    const primer_common::ExecutionRequest &request,
    const std::filesystem::path &scriptPath)
{
    switch (request.getBackend()) {
        case primer_common::BackendType::Local:
            return runLocal(request, scriptPath);
        case primer_common::BackendType::Remote:
            return runRemote(request, scriptPath);
        default:
            return primer_common::PrimerStatus::forCondition(
                primer_common::PrimerCondition::kPrimerInvariant, "invalid backend type");
    }
}

tempo_utils::Result<primer_common::ExecutionResult>
primer_orchestrator::ExecutionOrchestrator::runLocal(
    const primer_common::ExecutionRequest &request,
    const std::filesystem::path &scriptPath)
{
    auto timeout = m_config.localTimeout;
    auto requestTimeout = request.getTimeout();
    if (!requestTimeout.isEmpty()) {
        timeout = requestTimeout.getValue();
    }

    auto startTime = absl::Now();
    auto runResult = m_localRunner->run(scriptPath, timeout);
    if (runResult.isResult())
        return runResult.getResult();

    auto status = runResult.getStatus();

    // the script may have been removed after it was resolved
    if (has_condition(status, primer_common::PrimerCondition::kNotFound))
        return primer_common::ExecutionResult::failed({}, {}, {}, absl::Now() - startTime,
            primer_common::BackendType::Local, absl::StrCat("lesson not found: ", status.getMessage()));
    if (has_condition(status, primer_common::PrimerCondition::kInvalidInput))
        return primer_common::ExecutionResult::failed({}, {}, {}, absl::Now() - startTime,
            primer_common::BackendType::Local, status.getMessage());
    return status;
}

tempo_utils::Result<primer_common::ExecutionResult>
primer_orchestrator::ExecutionOrchestrator::runRemote(
    const primer_common::ExecutionRequest &request,
    const std::filesystem::path &scriptPath)
{
    auto startTime = absl::Now();

    // never submit to a backend which is not healthy
    if (!m_sandboxClient->healthCheck()) {
        TU_LOG_WARN << "sandbox is unavailable, rejecting lesson " << request.getLessonId();
        return primer_common::ExecutionResult::backendUnavailable(primer_common::BackendType::Remote,
            "sandbox health check failed", absl::Now() - startTime);
    }

    tempo_utils::FileReader scriptReader(scriptPath);
    if (!scriptReader.isValid())
        return scriptReader.getStatus();
    auto scriptBytes = scriptReader.getBytes();
    std::string sourceCode((const char *) scriptBytes->getData(), scriptBytes->getSize());

    auto submitResult = m_sandboxClient->submit(sourceCode, m_config.languageId);
    if (submitResult.isStatus()) {
        auto status = submitResult.getStatus();
        if (has_condition(status, primer_common::PrimerCondition::kServiceUnavailable)
            || has_condition(status, primer_common::PrimerCondition::kTimedOut))
            return primer_common::ExecutionResult::backendUnavailable(primer_common::BackendType::Remote,
                status.getMessage(), absl::Now() - startTime);
        if (has_condition(status, primer_common::PrimerCondition::kInvalidInput))
            return primer_common::ExecutionResult::failed({}, {}, {}, absl::Now() - startTime,
                primer_common::BackendType::Remote, status.getMessage());
        return status;
    }
    auto handle = submitResult.getResult();

    auto maxWait = m_config.maxPollWait;
    auto requestTimeout = request.getTimeout();
    if (!requestTimeout.isEmpty()) {
        maxWait = requestTimeout.getValue();
    }

    return waitForSubmission(handle, maxWait);
}

/**
 * Poll the submission at a fixed interval until it reaches a terminal state or the maximum wait
 * has elapsed. Each poll request is bounded by the time remaining, so the total wait does not
 * exceed the maximum wait by more than the minimum poll timeout. The handle is always consumed
 * when this method returns.
 *
 * @param handle The submission handle.
 * @param maxWait The maximum time to wait for the submission to finish.
 * @return The execution result.
 */
primer_common::ExecutionResult
primer_orchestrator::ExecutionOrchestrator::waitForSubmission(
    primer_sandbox::SubmissionHandle &handle,
    absl::Duration maxWait)
{
    auto startTime = absl::Now();
    auto deadline = startTime + maxWait;
    int attempts = 0;

    for (;;) {
        attempts++;
        auto pollTimeout = std::max(deadline - absl::Now(), kMinimumPollTimeout);
        auto pollResult = m_sandboxClient->poll(handle, pollTimeout);
        if (pollResult.isStatus()) {
            auto status = pollResult.getStatus();
            handle.consume();
            if (has_condition(status, primer_common::PrimerCondition::kTimedOut) || absl::Now() >= deadline)
                break;
            TU_LOG_WARN << "failed to poll submission " << handle.getToken() << ": " << status;
            return primer_common::ExecutionResult::backendUnavailable(primer_common::BackendType::Remote,
                status.getMessage(), absl::Now() - startTime);
        }

        auto poll = pollResult.getResult();
        if (poll.isTerminal()) {
            handle.consume();
            return poll.getResult();
        }

        auto remaining = deadline - absl::Now();
        if (remaining <= absl::ZeroDuration())
            break;
        absl::SleepFor(std::min(m_config.pollInterval, remaining));
    }

    TU_LOG_WARN << "submission " << handle.getToken() << " did not finish after "
        << attempts << " polls";
    handle.consume();
    return primer_common::ExecutionResult::timedOut({}, {}, absl::Now() - startTime,
        primer_common::BackendType::Remote,
        absl::StrCat("submission did not finish within ", absl::FormatDuration(maxWait)));
}

void
primer_orchestrator::ExecutionOrchestrator::appendHistory(
    const primer_common::ExecutionRequest &request,
    const primer_common::ExecutionResult &result)
{
    absl::MutexLock locker(&m_lock);
    m_history.push_back(primer_common::HistoryEntry{request, result, absl::Now()});
}

/**
 * Returns a snapshot of the execution history in insertion order.
 *
 * @return The execution history.
 */
std::vector<primer_common::HistoryEntry>
primer_orchestrator::ExecutionOrchestrator::history() const
{
    absl::MutexLock locker(&m_lock);
    return m_history;
}

/**
 * Summarize the execution history against the lessons which are available. A lesson is counted
 * as completed if at least one of its executions succeeded.
 *
 * @return The progress summary, or notOk status if the available lessons could not be listed.
 */
tempo_utils::Result<primer_orchestrator::ProgressSummary>
primer_orchestrator::ExecutionOrchestrator::summarizeProgress() const
{
    auto entries = history();

    ProgressSummary summary;
    absl::flat_hash_set<std::string> completed;
    for (const auto &entry : entries) {
        summary.totalExecutions++;
        summary.executionsByBackend[entry.request.getBackend()]++;
        if (entry.result.getStatus() == primer_common::ExecutionStatus::Succeeded) {
            completed.insert(entry.request.getLessonId());
        }
    }
    summary.lessonsCompleted = static_cast<int>(completed.size());

    std::vector<std::string> categories;
    TU_ASSIGN_OR_RETURN (categories, m_resolver->listCategories());
    for (const auto &category : categories) {
        std::vector<std::string> lessons;
        TU_ASSIGN_OR_RETURN (lessons, m_resolver->listLessons(category));

        auto &progress = summary.progressByCategory[category];
        progress.available = static_cast<int>(lessons.size());
        for (const auto &lesson : lessons) {
            if (completed.contains(absl::StrCat(category, "/", lesson))) {
                progress.completed++;
            }
        }
        summary.lessonsAvailable += progress.available;
    }

    return summary;
}
