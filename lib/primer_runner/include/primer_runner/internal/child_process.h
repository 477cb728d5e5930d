#ifndef PRIMER_RUNNER_INTERNAL_CHILD_PROCESS_H
#define PRIMER_RUNNER_INTERNAL_CHILD_PROCESS_H

#include <filesystem>
#include <memory>

#include <absl/time/time.h>
#include <uv.h>

#include <tempo_utils/integer_types.h>
#include <tempo_utils/process_builder.h>
#include <tempo_utils/status.h>

#include "output_capture.h"

namespace primer_runner::internal {

    enum class ChildState {
        Initial,        // process has not been spawned
        Running,        // process is running
        Exited,         // process has exited, output may still be draining
    };

    /**
     * A child process running on a private event loop. The process is made the leader of its
     * own process group so that terminating it also terminates any processes it started.
     */
    class ChildProcess {
    public:
        ChildProcess(const tempo_utils::ProcessInvoker &invoker, uv_loop_t *loop);

        ChildState getState() const;
        int getPid() const;
        bool isTimedOut() const;
        tu_int64 getExitStatus() const;
        int getExitSignal() const;

        std::string getOutput() const;
        std::string getError() const;

        tempo_utils::Status spawn(const std::filesystem::path &workingDirectory, absl::Duration timeout);
        tempo_utils::Status terminate(int signal);
        void shutdown();

    private:
        tempo_utils::ProcessInvoker m_invoker;
        uv_loop_t *m_loop;
        uv_process_t m_process;
        uv_timer_t m_watchdog;
        std::unique_ptr<OutputCapture> m_capture;
        ChildState m_state;
        bool m_processIsClosed;
        bool m_watchdogIsClosed;
        bool m_timedOut;
        tu_int64 m_exitStatus;
        int m_exitSignal;

        void release(tu_int64 status, int signal);
        void expire();
        void drain();

        friend void on_process_exit(uv_process_t *child, int64_t status, int signal);
        friend void on_watchdog_expired(uv_timer_t *timer);
        friend void on_drain_expired(uv_timer_t *timer);
    };

    void on_process_exit(uv_process_t *child, int64_t status, int signal);
    void on_watchdog_expired(uv_timer_t *timer);
    void on_drain_expired(uv_timer_t *timer);
}

#endif // PRIMER_RUNNER_INTERNAL_CHILD_PROCESS_H
