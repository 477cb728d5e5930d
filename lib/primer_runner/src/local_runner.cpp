
#include <primer_common/primer_result.h>
#include <primer_runner/internal/child_process.h>
#include <primer_runner/internal/interpreter_utils.h>
#include <primer_runner/local_runner.h>
#include <tempo_utils/log_stream.h>
#include <tempo_utils/process_builder.h>

primer_runner::LocalRunner::LocalRunner(const RunnerOptions &options)
    : m_options(options)
{
}

primer_runner::RunnerOptions
primer_runner::LocalRunner::getOptions() const
{
    return m_options;
}

static primer_common::ExecutionResult
make_execution_result(
    const primer_runner::internal::ChildProcess &process,
    absl::Duration timeout,
    absl::Duration duration)
{
    auto out = process.getOutput();
    auto err = process.getError();

    if (process.isTimedOut())
        return primer_common::ExecutionResult::timedOut(out, err, duration,
            primer_common::BackendType::Local,
            fmt::format("script exceeded timeout of {}ms", absl::ToInt64Milliseconds(timeout)));

    if (process.getExitSignal() != 0)
        return primer_common::ExecutionResult::failed(out, err, {}, duration,
            primer_common::BackendType::Local,
            fmt::format("script was terminated by signal {}", process.getExitSignal()));

    auto exitStatus = static_cast<int>(process.getExitStatus());
    if (exitStatus == 0)
        return primer_common::ExecutionResult::succeeded(out, err, duration,
            primer_common::BackendType::Local);

    return primer_common::ExecutionResult::failed(out, err, Option<int>(exitStatus), duration,
        primer_common::BackendType::Local,
        fmt::format("script exited with status {}", exitStatus));
}

/**
 * Close the process handles and run the loop until all close callbacks have completed, then
 * close the loop.
 */
static void
close_loop(uv_loop_t *loop, primer_runner::internal::ChildProcess &process)
{
    process.shutdown();
    uv_run(loop, UV_RUN_DEFAULT);
    auto ret = uv_loop_close(loop);
    TU_LOG_ERROR_IF(ret < 0) << "failed to close loop: " << uv_strerror(ret);
}

tempo_utils::Result<primer_common::ExecutionResult>
primer_runner::LocalRunner::run(const std::filesystem::path &scriptPath, absl::Duration timeout)
{
    if (!std::filesystem::exists(scriptPath))
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kNotFound,
            "script {} not found", scriptPath.string());
    if (timeout <= absl::ZeroDuration())
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kInvalidInput,
            "timeout must be positive");

    std::filesystem::path interpreterPath;
    TU_ASSIGN_OR_RETURN (interpreterPath, internal::resolve_interpreter(m_options.interpreter));

    auto absoluteScriptPath = std::filesystem::absolute(scriptPath);
    tempo_utils::ProcessBuilder builder(interpreterPath);
    for (const auto &arg : m_options.interpreterArgs) {
        builder.appendArg(arg);
    }
    builder.appendArg(absoluteScriptPath.string());
    auto invoker = builder.toInvoker();

    std::filesystem::path workingDirectory = m_options.workingDirectory;
    if (workingDirectory.empty()) {
        workingDirectory = absoluteScriptPath.parent_path();
    }

    uv_loop_t loop;
    auto ret = uv_loop_init(&loop);
    if (ret < 0)
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kPrimerInvariant,
            "failed to initialize loop: {} ({})", uv_strerror(ret), uv_err_name(ret));

    internal::ChildProcess process(invoker, &loop);

    auto startTime = absl::Now();
    auto status = process.spawn(workingDirectory, timeout);
    if (status.notOk()) {
        close_loop(&loop, process);
        return status;
    }

    TU_LOG_INFO << "running " << absoluteScriptPath.string() << " with pid " << process.getPid()
        << " (timeout " << absl::FormatDuration(timeout) << ")";

    // run until the process has exited and its output has been drained
    uv_run(&loop, UV_RUN_DEFAULT);
    auto duration = absl::Now() - startTime;

    if (process.getState() != internal::ChildState::Exited) {
        close_loop(&loop, process);
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kPrimerInvariant,
            "loop finished before script {} exited", absoluteScriptPath.string());
    }

    auto result = make_execution_result(process, timeout, duration);
    close_loop(&loop, process);

    TU_LOG_INFO << "script " << absoluteScriptPath.string() << " finished with status "
        << primer_common::execution_status_to_string(result.getStatus())
        << " after " << absl::FormatDuration(duration);

    return result;
}
