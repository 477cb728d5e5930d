
#include <cstring>

#include <primer_runner/internal/output_capture.h>
#include <tempo_utils/log_stream.h>

primer_runner::internal::OutputCapture::OutputCapture(uv_loop_t *loop)
    : m_loop(loop)
{
    TU_ASSERT (m_loop != nullptr);
    memset(&m_out, 0, sizeof(uv_pipe_t));
    memset(&m_err, 0, sizeof(uv_pipe_t));
    m_outIsClosed = true;
    m_errIsClosed = true;
}

primer_runner::internal::OutputCapture::~OutputCapture()
{
    TU_LOG_WARN_IF(!isClosed()) << "output capture was destroyed while pipes are open";
}

tempo_utils::Status
primer_runner::internal::OutputCapture::initialize()
{
    if (m_loop == nullptr)
        return tempo_utils::GenericStatus::forCondition(
            tempo_utils::GenericCondition::kInternalViolation, "initialization failed");

    int ret;

    ret = uv_pipe_init(m_loop, &m_out, 0);
    if (ret < 0) {
        m_loop = nullptr;   // set null so initialization cannot be invoked more than once
        return tempo_utils::GenericStatus::forCondition(
            tempo_utils::GenericCondition::kInternalViolation,
            "failed to create output pipe: {} ({})", uv_strerror(ret), uv_err_name(ret));
    }
    m_out.data = this;
    m_outIsClosed = false;

    ret = uv_pipe_init(m_loop, &m_err, 0);
    if (ret < 0) {
        m_loop = nullptr;
        return tempo_utils::GenericStatus::forCondition(
            tempo_utils::GenericCondition::kInternalViolation,
            "failed to create error pipe: {} ({})", uv_strerror(ret), uv_err_name(ret));
    }
    m_err.data = this;
    m_errIsClosed = false;

    m_loop = nullptr;
    return {};
}

static void
on_buf_alloc(uv_handle_t *handle, size_t suggested_size, uv_buf_t *buf)
{
    buf->base = (char *) malloc(suggested_size);
    TU_ASSERT (buf->base != nullptr);
    buf->len = suggested_size;
}

void
primer_runner::internal::on_pipe_read(uv_stream_t *stream, ssize_t nread, const uv_buf_t *buf)
{
    auto *capture = (OutputCapture *) stream->data;

    // empty read, nothing to do
    if (nread == 0) {
        free(buf->base);
        return;
    }

    // if we reached the end of the stream, then close it
    if (nread == UV_EOF) {
        free(buf->base);
        capture->closeCapture(stream);
        return;
    }

    // otherwise if nread indicates any other error then log it and stop reading
    if (nread < 0) {
        free(buf->base);
        TU_LOG_ERROR << "failed to read from stream: " << uv_strerror(nread)
            << "(" << uv_err_name(nread) << ")";
        capture->closeCapture(stream);
        return;
    }

    if (stream == (uv_stream_t *) &capture->m_err) {
        capture->m_errData.append(buf->base, nread);
    } else if (stream == (uv_stream_t *) &capture->m_out) {
        capture->m_outData.append(buf->base, nread);
    }
    free(buf->base);
}

tempo_utils::Status
primer_runner::internal::OutputCapture::openCapture()
{
    int ret;

    ret = uv_read_start((uv_stream_t *) &m_out, on_buf_alloc, on_pipe_read);
    if (ret < 0)
        return tempo_utils::GenericStatus::forCondition(
            tempo_utils::GenericCondition::kInternalViolation,
            "failed to start read on output pipe: {} ({})", uv_strerror(ret), uv_err_name(ret));

    ret = uv_read_start((uv_stream_t *) &m_err, on_buf_alloc, on_pipe_read);
    if (ret < 0)
        return tempo_utils::GenericStatus::forCondition(
            tempo_utils::GenericCondition::kInternalViolation,
            "failed to start read on error pipe: {} ({})", uv_strerror(ret), uv_err_name(ret));

    return {};
}

void
primer_runner::internal::OutputCapture::closeCapture(uv_stream_t *stream)
{
    TU_ASSERT (stream != nullptr);

    if (stream == (uv_stream_t *) &m_out && !m_outIsClosed) {
        uv_close((uv_handle_t *) &m_out, nullptr);
        m_outIsClosed = true;
    }
    if (stream == (uv_stream_t *) &m_err && !m_errIsClosed) {
        uv_close((uv_handle_t *) &m_err, nullptr);
        m_errIsClosed = true;
    }
}

void
primer_runner::internal::OutputCapture::closeCaptureUnconditionally()
{
    if (!m_outIsClosed) {
        uv_close((uv_handle_t *) &m_out, nullptr);
        m_outIsClosed = true;
    }
    if (!m_errIsClosed) {
        uv_close((uv_handle_t *) &m_err, nullptr);
        m_errIsClosed = true;
    }
}

bool
primer_runner::internal::OutputCapture::isClosed() const
{
    return m_outIsClosed && m_errIsClosed;
}

uv_stream_t *
primer_runner::internal::OutputCapture::getOutput() const
{
    return (uv_stream_t *) &m_out;
}

uv_stream_t *
primer_runner::internal::OutputCapture::getError() const
{
    return (uv_stream_t *) &m_err;
}

std::string
primer_runner::internal::OutputCapture::getOutputData() const
{
    return m_outData;
}

std::string
primer_runner::internal::OutputCapture::getErrorData() const
{
    return m_errData;
}
