
#include <absl/strings/str_cat.h>

#include <primer_common/execution_types.h>
#include <tempo_utils/log_stream.h>

const char *
primer_common::backend_type_to_string(BackendType backendType)
{
    switch (backendType) {
        case BackendType::Local:
            return "Local";
        case BackendType::Remote:
            return "Remote";
        default:
            return "Invalid";
    }
}

const char *
primer_common::execution_status_to_string(ExecutionStatus executionStatus)
{
    switch (executionStatus) {
        case ExecutionStatus::Succeeded:
            return "Succeeded";
        case ExecutionStatus::Failed:
            return "Failed";
        case ExecutionStatus::TimedOut:
            return "TimedOut";
        case ExecutionStatus::BackendUnavailable:
            return "BackendUnavailable";
        default:
            return "Invalid";
    }
}

primer_common::ExecutionRequest::ExecutionRequest()
    : m_backend(BackendType::Invalid)
{
}

primer_common::ExecutionRequest::ExecutionRequest(
    std::string_view category,
    std::string_view name,
    BackendType backend,
    Option<absl::Duration> timeout)
    : m_category(category),
      m_name(name),
      m_backend(backend),
      m_timeout(timeout)
{
    TU_ASSERT (m_backend != BackendType::Invalid);
}

primer_common::ExecutionRequest::ExecutionRequest(const ExecutionRequest &other)
    : m_category(other.m_category),
      m_name(other.m_name),
      m_backend(other.m_backend),
      m_timeout(other.m_timeout)
{
}

bool
primer_common::ExecutionRequest::isValid() const
{
    return m_backend != BackendType::Invalid;
}

std::string
primer_common::ExecutionRequest::getCategory() const
{
    return m_category;
}

std::string
primer_common::ExecutionRequest::getName() const
{
    return m_name;
}

primer_common::BackendType
primer_common::ExecutionRequest::getBackend() const
{
    return m_backend;
}

Option<absl::Duration>
primer_common::ExecutionRequest::getTimeout() const
{
    return m_timeout;
}

/**
 * Returns the lesson identifier in the form `category/name`. If the category is empty then
 * only the name is returned.
 *
 * @return The lesson identifier.
 */
std::string
primer_common::ExecutionRequest::getLessonId() const
{
    if (m_category.empty())
        return m_name;
    return absl::StrCat(m_category, "/", m_name);
}

primer_common::ExecutionResult::ExecutionResult()
    : m_status(ExecutionStatus::Invalid),
      m_duration(absl::ZeroDuration()),
      m_backendUsed(BackendType::Invalid)
{
}

primer_common::ExecutionResult::ExecutionResult(
    ExecutionStatus status,
    std::string_view out,
    std::string_view err,
    Option<int> exitCode,
    absl::Duration duration,
    BackendType backendUsed,
    std::string_view message)
    : m_status(status),
      m_stdout(out),
      m_stderr(err),
      m_exitCode(exitCode),
      m_duration(duration),
      m_backendUsed(backendUsed),
      m_message(message)
{
    TU_ASSERT (m_status != ExecutionStatus::Invalid);
    TU_ASSERT (m_backendUsed != BackendType::Invalid);
}

primer_common::ExecutionResult::ExecutionResult(const ExecutionResult &other)
    : m_status(other.m_status),
      m_stdout(other.m_stdout),
      m_stderr(other.m_stderr),
      m_exitCode(other.m_exitCode),
      m_duration(other.m_duration),
      m_backendUsed(other.m_backendUsed),
      m_message(other.m_message)
{
}

primer_common::ExecutionResult &
primer_common::ExecutionResult::operator=(const ExecutionResult &other)
{
    if (this != &other) {
        m_status = other.m_status;
        m_stdout = other.m_stdout;
        m_stderr = other.m_stderr;
        m_exitCode = other.m_exitCode;
        m_duration = other.m_duration;
        m_backendUsed = other.m_backendUsed;
        m_message = other.m_message;
    }
    return *this;
}

bool
primer_common::ExecutionResult::isValid() const
{
    return m_status != ExecutionStatus::Invalid;
}

primer_common::ExecutionStatus
primer_common::ExecutionResult::getStatus() const
{
    return m_status;
}

std::string
primer_common::ExecutionResult::getStdout() const
{
    return m_stdout;
}

std::string
primer_common::ExecutionResult::getStderr() const
{
    return m_stderr;
}

Option<int>
primer_common::ExecutionResult::getExitCode() const
{
    return m_exitCode;
}

absl::Duration
primer_common::ExecutionResult::getDuration() const
{
    return m_duration;
}

primer_common::BackendType
primer_common::ExecutionResult::getBackendUsed() const
{
    return m_backendUsed;
}

std::string
primer_common::ExecutionResult::getMessage() const
{
    return m_message;
}

/**
 * Returns a copy of the result with the duration replaced.
 *
 * @param duration The new duration.
 * @return The copied result.
 */
primer_common::ExecutionResult
primer_common::ExecutionResult::withDuration(absl::Duration duration) const
{
    ExecutionResult result(*this);
    result.m_duration = duration;
    return result;
}

primer_common::ExecutionResult
primer_common::ExecutionResult::succeeded(
    std::string_view out,
    std::string_view err,
    absl::Duration duration,
    BackendType backendUsed)
{
    return ExecutionResult(ExecutionStatus::Succeeded, out, err, Option<int>(0),
        duration, backendUsed, {});
}

primer_common::ExecutionResult
primer_common::ExecutionResult::failed(
    std::string_view out,
    std::string_view err,
    Option<int> exitCode,
    absl::Duration duration,
    BackendType backendUsed,
    std::string_view message)
{
    return ExecutionResult(ExecutionStatus::Failed, out, err, exitCode,
        duration, backendUsed, message);
}

primer_common::ExecutionResult
primer_common::ExecutionResult::timedOut(
    std::string_view out,
    std::string_view err,
    absl::Duration duration,
    BackendType backendUsed,
    std::string_view message)
{
    return ExecutionResult(ExecutionStatus::TimedOut, out, err, {},
        duration, backendUsed, message);
}

primer_common::ExecutionResult
primer_common::ExecutionResult::backendUnavailable(
    BackendType backendUsed,
    std::string_view message,
    absl::Duration duration)
{
    return ExecutionResult(ExecutionStatus::BackendUnavailable, {}, {}, {},
        duration, backendUsed, message);
}
