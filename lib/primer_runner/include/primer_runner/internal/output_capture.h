#ifndef PRIMER_RUNNER_INTERNAL_OUTPUT_CAPTURE_H
#define PRIMER_RUNNER_INTERNAL_OUTPUT_CAPTURE_H

#include <string>

#include <uv.h>

#include <tempo_utils/status.h>

namespace primer_runner::internal {

    /**
     * Collects the output and error streams of a child process into separate buffers.
     */
    class OutputCapture {
    public:
        explicit OutputCapture(uv_loop_t *loop);
        ~OutputCapture();

        tempo_utils::Status initialize();
        tempo_utils::Status openCapture();
        void closeCapture(uv_stream_t *stream);
        void closeCaptureUnconditionally();

        bool isClosed() const;

        uv_stream_t *getOutput() const;
        uv_stream_t *getError() const;

        std::string getOutputData() const;
        std::string getErrorData() const;

    private:
        uv_loop_t *m_loop;
        uv_pipe_t m_out;
        uv_pipe_t m_err;
        bool m_outIsClosed;
        bool m_errIsClosed;
        std::string m_outData;
        std::string m_errData;

        friend void on_pipe_read(uv_stream_t *stream, ssize_t nread, const uv_buf_t *buf);
    };

    void on_pipe_read(uv_stream_t *stream, ssize_t nread, const uv_buf_t *buf);
}

#endif // PRIMER_RUNNER_INTERNAL_OUTPUT_CAPTURE_H
