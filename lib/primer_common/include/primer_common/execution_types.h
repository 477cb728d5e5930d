#ifndef PRIMER_COMMON_EXECUTION_TYPES_H
#define PRIMER_COMMON_EXECUTION_TYPES_H

#include <string>

#include <absl/time/time.h>

#include <tempo_utils/option_template.h>

namespace primer_common {

    enum class BackendType {
        Invalid,
        Local,                  // script is run as a child process of the caller
        Remote,                 // script is submitted to a remote sandbox service
    };

    enum class ExecutionStatus {
        Invalid,
        Succeeded,              // script ran to completion and exited with status 0
        Failed,                 // script ran and failed, or could not be run at all
        TimedOut,               // script or remote wait exceeded its time bound
        BackendUnavailable,     // backend rejected the request or could not be reached
    };

    const char *backend_type_to_string(BackendType backendType);
    const char *execution_status_to_string(ExecutionStatus executionStatus);

    /**
     * A request to execute a single lesson. Once constructed the request cannot be modified.
     */
    class ExecutionRequest {
    public:
        ExecutionRequest();
        ExecutionRequest(
            std::string_view category,
            std::string_view name,
            BackendType backend,
            Option<absl::Duration> timeout = {});
        ExecutionRequest(const ExecutionRequest &other);

        bool isValid() const;

        std::string getCategory() const;
        std::string getName() const;
        BackendType getBackend() const;
        Option<absl::Duration> getTimeout() const;

        std::string getLessonId() const;

    private:
        std::string m_category;
        std::string m_name;
        BackendType m_backend;
        Option<absl::Duration> m_timeout;
    };

    /**
     * The normalized outcome of executing a lesson on either backend. Instances are constructed
     * through the named factory functions, which guarantee that a Succeeded result always carries
     * exit code 0.
     */
    class ExecutionResult {
    public:
        ExecutionResult();
        ExecutionResult(const ExecutionResult &other);
        ExecutionResult &operator=(const ExecutionResult &other);

        bool isValid() const;

        ExecutionStatus getStatus() const;
        std::string getStdout() const;
        std::string getStderr() const;
        Option<int> getExitCode() const;
        absl::Duration getDuration() const;
        BackendType getBackendUsed() const;
        std::string getMessage() const;

        ExecutionResult withDuration(absl::Duration duration) const;

        static ExecutionResult succeeded(
            std::string_view out,
            std::string_view err,
            absl::Duration duration,
            BackendType backendUsed);
        static ExecutionResult failed(
            std::string_view out,
            std::string_view err,
            Option<int> exitCode,
            absl::Duration duration,
            BackendType backendUsed,
            std::string_view message = {});
        static ExecutionResult timedOut(
            std::string_view out,
            std::string_view err,
            absl::Duration duration,
            BackendType backendUsed,
            std::string_view message = {});
        static ExecutionResult backendUnavailable(
            BackendType backendUsed,
            std::string_view message,
            absl::Duration duration = absl::ZeroDuration());

    private:
        ExecutionStatus m_status;
        std::string m_stdout;
        std::string m_stderr;
        Option<int> m_exitCode;
        absl::Duration m_duration;
        BackendType m_backendUsed;
        std::string m_message;

        ExecutionResult(
            ExecutionStatus status,
            std::string_view out,
            std::string_view err,
            Option<int> exitCode,
            absl::Duration duration,
            BackendType backendUsed,
            std::string_view message);
    };

    struct HistoryEntry {
        ExecutionRequest request;
        ExecutionResult result;
        absl::Time timestamp;
    };
}

#endif // PRIMER_COMMON_EXECUTION_TYPES_H
