
#include <csignal>
#include <cstring>

#include <primer_common/primer_result.h>
#include <primer_runner/internal/child_process.h>
#include <tempo_utils/log_stream.h>

// once the process has exited, this is how long we wait for its output pipes to reach EOF
constexpr int kDrainTimeoutMillis = 250;

primer_runner::internal::ChildProcess::ChildProcess(
    const tempo_utils::ProcessInvoker &invoker,
    uv_loop_t *loop)
    : m_invoker(invoker),
      m_loop(loop),
      m_state(ChildState::Initial),
      m_processIsClosed(true),
      m_watchdogIsClosed(true),
      m_timedOut(false),
      m_exitStatus(-1),
      m_exitSignal(0)
{
    TU_ASSERT (m_invoker.isValid());
    TU_ASSERT (m_loop != nullptr);
    memset(&m_process, 0, sizeof(uv_process_t));
    memset(&m_watchdog, 0, sizeof(uv_timer_t));
    m_process.data = this;
    m_watchdog.data = this;
    m_capture = std::make_unique<OutputCapture>(m_loop);
}

primer_runner::internal::ChildState
primer_runner::internal::ChildProcess::getState() const
{
    return m_state;
}

int
primer_runner::internal::ChildProcess::getPid() const
{
    return m_process.pid;
}

bool
primer_runner::internal::ChildProcess::isTimedOut() const
{
    return m_timedOut;
}

tu_int64
primer_runner::internal::ChildProcess::getExitStatus() const
{
    return m_exitStatus;
}

int
primer_runner::internal::ChildProcess::getExitSignal() const
{
    return m_exitSignal;
}

std::string
primer_runner::internal::ChildProcess::getOutput() const
{
    return m_capture->getOutputData();
}

std::string
primer_runner::internal::ChildProcess::getError() const
{
    return m_capture->getErrorData();
}

/**
 * Async callback which is called when the child process exits.
 *
 * @param child The UV process handle.
 * @param status The exit status of the process.
 * @param signal The signal which caused the process to exit, if applicable.
 */
void
primer_runner::internal::on_process_exit(uv_process_t *child, int64_t status, int signal)
{
    auto *process = (ChildProcess *) child->data;
    TU_LOG_V << "child process " << child->pid << " exited with status " << status << " signal " << signal;
    process->release(status, signal);
}

/**
 * Async callback which is called when the child process has run longer than its timeout.
 *
 * @param timer The UV timer handle.
 */
void
primer_runner::internal::on_watchdog_expired(uv_timer_t *timer)
{
    auto *process = (ChildProcess *) timer->data;
    process->expire();
}

void
primer_runner::internal::on_drain_expired(uv_timer_t *timer)
{
    auto *process = (ChildProcess *) timer->data;
    process->drain();
}

/**
 * Spawn the child process using the specified working directory and arm the watchdog timer.
 * If the process has not exited when the timer fires then the process group is killed.
 *
 * @param workingDirectory The working directory, or empty to inherit the working directory.
 * @param timeout The maximum time the process may run.
 * @return Ok status if the process was spawned successfully, otherwise notOk status.
 */
tempo_utils::Status
primer_runner::internal::ChildProcess::spawn(
    const std::filesystem::path &workingDirectory,
    absl::Duration timeout)
{
    if (m_state != ChildState::Initial)
        return primer_common::PrimerStatus::forCondition(primer_common::PrimerCondition::kPrimerInvariant,
            "cannot spawn child process: invalid process state");

    TU_RETURN_IF_NOT_OK (m_capture->initialize());

    auto ret = uv_timer_init(m_loop, &m_watchdog);
    if (ret < 0)
        return primer_common::PrimerStatus::forCondition(primer_common::PrimerCondition::kPrimerInvariant,
            "failed to create watchdog timer: {} ({})", uv_strerror(ret), uv_err_name(ret));
    m_watchdogIsClosed = false;

    // set process options for spawning the interpreter
    uv_process_options_t processOptions;
    memset(&processOptions, 0, sizeof(uv_process_options_t));
    processOptions.file = m_invoker.getExecutable();
    processOptions.args = m_invoker.getArgv();
    processOptions.exit_cb = on_process_exit;
    processOptions.flags = UV_PROCESS_DETACHED;
    std::string cwd = workingDirectory.string();
    if (!cwd.empty()) {
        processOptions.cwd = cwd.c_str();
    }
    TU_LOG_V << "process invocation: " << m_invoker;

    // configure child process IO
    uv_stdio_container_t processStdio[3];
    processStdio[0].flags = UV_IGNORE;
    processStdio[1].flags = (uv_stdio_flags) (UV_CREATE_PIPE | UV_WRITABLE_PIPE);
    processStdio[1].data.stream = m_capture->getOutput();
    processStdio[2].flags = (uv_stdio_flags) (UV_CREATE_PIPE | UV_WRITABLE_PIPE);
    processStdio[2].data.stream = m_capture->getError();
    processOptions.stdio = processStdio;
    processOptions.stdio_count = 3;

    // the process handle must be closed even if spawning fails
    ret = uv_spawn(m_loop, &m_process, &processOptions);
    m_processIsClosed = false;
    if (ret < 0)
        return primer_common::PrimerStatus::forCondition(primer_common::PrimerCondition::kProcessFailure,
            "failed to spawn child process: {} ({})", uv_strerror(ret), uv_err_name(ret));

    m_state = ChildState::Running;
    TU_LOG_V << "spawned child process with pid " << m_process.pid;

    TU_RETURN_IF_NOT_OK (m_capture->openCapture());

    auto timeoutMillis = absl::ToInt64Milliseconds(timeout);
    ret = uv_timer_start(&m_watchdog, on_watchdog_expired, timeoutMillis, 0);
    if (ret < 0)
        return primer_common::PrimerStatus::forCondition(primer_common::PrimerCondition::kPrimerInvariant,
            "failed to start watchdog timer: {} ({})", uv_strerror(ret), uv_err_name(ret));

    return {};
}

/**
 * Send the specified signal to the process group of the child process. Terminating a process
 * which has already exited has no effect.
 *
 * @param signal The signal number.
 * @return Ok status if the process was signaled or had already exited, otherwise notOk status.
 */
tempo_utils::Status
primer_runner::internal::ChildProcess::terminate(int signal)
{
    if (m_state != ChildState::Running)
        return {};

    // the child is a process group leader, so signal the whole group
    auto ret = uv_kill(-m_process.pid, signal);
    if (ret == UV_ESRCH) {
        ret = uv_process_kill(&m_process, signal);
    }
    if (ret == UV_ESRCH)
        return {};
    if (ret < 0)
        return primer_common::PrimerStatus::forCondition(primer_common::PrimerCondition::kProcessFailure,
            "failed to terminate child process {}: {} ({})", m_process.pid, uv_strerror(ret), uv_err_name(ret));

    TU_LOG_V << "sent signal " << signal << " to child process " << m_process.pid;
    return {};
}

void
primer_runner::internal::ChildProcess::expire()
{
    TU_LOG_WARN << "child process " << m_process.pid << " exceeded its timeout";
    m_timedOut = true;
    auto status = terminate(SIGKILL);
    TU_LOG_ERROR_IF(status.notOk()) << "failed to kill child process: " << status;
}

/**
 * Record the exit status of the child process and close the process handle. Output which was
 * written before the process exited is drained for a bounded time, unless the process was killed
 * by the watchdog in which case the pipes are closed immediately.
 *
 * @param status The exit status.
 * @param signal The termination signal.
 */
void
primer_runner::internal::ChildProcess::release(tu_int64 status, int signal)
{
    m_state = ChildState::Exited;
    m_exitStatus = status;
    m_exitSignal = signal;

    uv_close((uv_handle_t *) &m_process, nullptr);
    m_processIsClosed = true;

    uv_timer_stop(&m_watchdog);
    if (m_timedOut || m_capture->isClosed()) {
        drain();
        return;
    }

    // the drain timer does not keep the loop alive if the pipes close before it fires
    uv_timer_start(&m_watchdog, on_drain_expired, kDrainTimeoutMillis, 0);
    uv_unref((uv_handle_t *) &m_watchdog);
}

void
primer_runner::internal::ChildProcess::drain()
{
    m_capture->closeCaptureUnconditionally();
    if (!m_watchdogIsClosed) {
        uv_close((uv_handle_t *) &m_watchdog, nullptr);
        m_watchdogIsClosed = true;
    }
}

/**
 * Close all handles which are still open. If the child is still running it is killed and the
 * loop is run until the exit callback has reaped it, so the process handle is never closed
 * before the child has been waited on. The caller must run the loop afterwards so the close
 * callbacks complete before the loop is closed.
 */
void
primer_runner::internal::ChildProcess::shutdown()
{
    if (m_state == ChildState::Running) {
        auto status = terminate(SIGKILL);
        TU_LOG_ERROR_IF(status.notOk()) << "failed to kill child process: " << status;
        if (status.isOk()) {
            // pipes and the watchdog must not keep the loop busy while waiting for the exit
            m_capture->closeCaptureUnconditionally();
            if (!m_watchdogIsClosed) {
                uv_timer_stop(&m_watchdog);
            }
            while (m_state == ChildState::Running) {
                if (uv_run(m_loop, UV_RUN_ONCE) == 0)
                    break;
            }
            TU_LOG_ERROR_IF(m_state == ChildState::Running)
                << "child process " << m_process.pid << " was not reaped";
        }
    }
    if (!m_processIsClosed) {
        uv_close((uv_handle_t *) &m_process, nullptr);
        m_processIsClosed = true;
    }
    drain();
}
