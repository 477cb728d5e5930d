#ifndef PRIMER_ORCHESTRATOR_EXECUTION_ORCHESTRATOR_H
#define PRIMER_ORCHESTRATOR_EXECUTION_ORCHESTRATOR_H

#include <memory>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/synchronization/mutex.h>

#include <primer_common/execution_types.h>
#include <primer_runner/abstract_local_runner.h>
#include <primer_sandbox/abstract_sandbox_client.h>

#include "abstract_lesson_resolver.h"
#include "orchestrator_config.h"

namespace primer_orchestrator {

    enum class DispatchState {
        Pending,            // request has been received but not dispatched to a backend
        Dispatched,         // request has been handed to a backend
        Finished,           // backend produced a terminal result
    };

    struct CategoryProgress {
        int completed = 0;
        int available = 0;
    };

    struct ProgressSummary {
        int totalExecutions = 0;
        int lessonsCompleted = 0;
        int lessonsAvailable = 0;
        absl::flat_hash_map<primer_common::BackendType, int> executionsByBackend;
        absl::flat_hash_map<std::string, CategoryProgress> progressByCategory;
    };

    /**
     * Executes lessons on the local or remote backend and keeps an append-only history of every
     * execution attempt for the lifetime of the orchestrator.
     */
    class ExecutionOrchestrator {
    public:
        ExecutionOrchestrator(
            const OrchestratorConfig &config,
            std::shared_ptr<AbstractLessonResolver> resolver,
            std::shared_ptr<primer_runner::AbstractLocalRunner> localRunner,
            std::shared_ptr<primer_sandbox::AbstractSandboxClient> sandboxClient);

        static std::shared_ptr<ExecutionOrchestrator> create(const OrchestratorConfig &config);

        OrchestratorConfig getConfig() const;

        tempo_utils::Result<primer_common::ExecutionResult> executeLesson(
            std::string_view category,
            std::string_view name,
            primer_common::BackendType backend);
        tempo_utils::Result<primer_common::ExecutionResult> executeLesson(
            std::string_view category,
            std::string_view name);
        tempo_utils::Result<primer_common::ExecutionResult> execute(
            const primer_common::ExecutionRequest &request);

        std::vector<primer_common::HistoryEntry> history() const;
        tempo_utils::Result<ProgressSummary> summarizeProgress() const;

    private:
        OrchestratorConfig m_config;
        std::shared_ptr<AbstractLessonResolver> m_resolver;
        std::shared_ptr<primer_runner::AbstractLocalRunner> m_localRunner;
        std::shared_ptr<primer_sandbox::AbstractSandboxClient> m_sandboxClient;

        mutable absl::Mutex m_lock;
        std::vector<primer_common::HistoryEntry> m_history ABSL_GUARDED_BY(m_lock);

        tempo_utils::Result<primer_common::ExecutionResult> dispatch(
            const primer_common::ExecutionRequest &request,
            const std::filesystem::path &scriptPath);
        tempo_utils::Result<primer_common::ExecutionResult> runLocal(
            const primer_common::ExecutionRequest &request,
            const std::filesystem::path &scriptPath);
        tempo_utils::Result<primer_common::ExecutionResult> runRemote(
            const primer_common::ExecutionRequest &request,
            const std::filesystem::path &scriptPath);
        primer_common::ExecutionResult waitForSubmission(
            primer_sandbox::SubmissionHandle &handle,
            absl::Duration maxWait);
        void appendHistory(
            const primer_common::ExecutionRequest &request,
            const primer_common::ExecutionResult &result);
    };
}

#endif // PRIMER_ORCHESTRATOR_EXECUTION_ORCHESTRATOR_H
