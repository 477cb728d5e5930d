
#include <arpa/inet.h>
#include <cstdlib>
#include <cstring>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include <tempo_utils/log_stream.h>

#include "sandbox_test_server.h"

struct TestConnection {
    uv_tcp_t tcp;
    uv_write_t req;
    std::string buffer;
    std::string reply;
    bool handled = false;
};

static const char *
reason_phrase(int statusCode)
{
    switch (statusCode) {
        case 200: return "OK";
        case 201: return "Created";
        case 404: return "Not Found";
        case 422: return "Unprocessable Entity";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

static void
on_handle_close(uv_handle_t *handle)
{
    auto *connection = static_cast<TestConnection *>(handle->data);
    delete connection;
}

static void
close_connection(TestConnection *connection)
{
    auto *handle = (uv_handle_t *) &connection->tcp;
    if (!uv_is_closing(handle)) {
        uv_close(handle, on_handle_close);
    }
}

static void
on_reply_written(uv_write_t *req, int status)
{
    auto *connection = static_cast<TestConnection *>(req->data);
    TU_LOG_ERROR_IF(status < 0) << "failed to write reply: " << uv_strerror(status);
    close_connection(connection);
}

/**
 * Parse the request once the header and the entity have been fully received.
 *
 * @return true if a complete request was parsed, otherwise false.
 */
static bool
parse_request(const std::string &buffer, RecordedRequest &request)
{
    auto headerEnd = buffer.find("\r\n\r\n");
    if (headerEnd == std::string::npos)
        return false;

    std::vector<std::string> lines = absl::StrSplit(buffer.substr(0, headerEnd), "\r\n");
    std::vector<std::string> requestLine = absl::StrSplit(lines.front(), ' ');
    if (requestLine.size() < 2)
        return false;

    size_t contentLength = 0;
    for (size_t i = 1; i < lines.size(); i++) {
        std::pair<std::string,std::string> header = absl::StrSplit(lines.at(i), absl::MaxSplits(':', 1));
        if (absl::EqualsIgnoreCase(header.first, "Content-Length")) {
            if (!absl::SimpleAtoi(absl::StripAsciiWhitespace(header.second), &contentLength))
                return false;
        }
    }

    auto entityStart = headerEnd + 4;
    if (buffer.size() < entityStart + contentLength)
        return false;

    request.method = requestLine.at(0);
    request.target = requestLine.at(1);
    request.path = request.target.substr(0, request.target.find('?'));
    request.entity = buffer.substr(entityStart, contentLength);
    return true;
}

static void
on_request(TestConnection *connection, const RecordedRequest &request)
{
    auto *server = static_cast<SandboxTestServer *>(connection->tcp.loop->data);

    CannedResponse response;
    if (!server->recordRequest(request, response)) {
        response.statusCode = 404;
        response.entity = R"({"error": "not found"})";
    }

    // leave the connection open, the client gives up when its request times out
    if (!response.reply)
        return;

    connection->reply = absl::StrCat(
        "HTTP/1.1 ", response.statusCode, " ", reason_phrase(response.statusCode), "\r\n",
        "Content-Type: application/json\r\n",
        "Content-Length: ", response.entity.size(), "\r\n",
        "Connection: close\r\n",
        "\r\n",
        response.entity);

    auto buf = uv_buf_init(connection->reply.data(), connection->reply.size());
    connection->req.data = connection;
    auto ret = uv_write(&connection->req, (uv_stream_t *) &connection->tcp, &buf, 1, on_reply_written);
    if (ret < 0) {
        TU_LOG_ERROR << "uv_write failed: " << uv_strerror(ret);
        close_connection(connection);
    }
}

static void
allocate_buffer(uv_handle_t *handle, size_t suggested_size, uv_buf_t *buf)
{
    buf->base = (char *) std::malloc(suggested_size);
    buf->len = suggested_size;
}

static void
on_read(uv_stream_t *stream, ssize_t nread, const uv_buf_t *buf)
{
    auto *connection = static_cast<TestConnection *>(stream->data);

    if (nread > 0) {
        connection->buffer.append(buf->base, nread);
    }
    std::free(buf->base);

    if (nread < 0) {
        close_connection(connection);
        return;
    }

    if (connection->handled)
        return;
    RecordedRequest request;
    if (parse_request(connection->buffer, request)) {
        connection->handled = true;
        on_request(connection, request);
    }
}

static void
on_new_connection(uv_stream_t *listener, int status)
{
    if (status < 0) {
        TU_LOG_ERROR << "failed to accept connection: " << uv_strerror(status);
        return;
    }

    auto *connection = new TestConnection();
    uv_tcp_init(listener->loop, &connection->tcp);
    connection->tcp.data = connection;

    auto ret = uv_accept(listener, (uv_stream_t *) &connection->tcp);
    if (ret < 0) {
        TU_LOG_ERROR << "uv_accept failed: " << uv_strerror(ret);
        close_connection(connection);
        return;
    }
    uv_read_start((uv_stream_t *) &connection->tcp, allocate_buffer, on_read);
}

static void
close_handle(uv_handle_t *handle, void *)
{
    if (!uv_is_closing(handle)) {
        uv_close(handle, on_handle_close);
    }
}

static void
on_stop(uv_async_t *async)
{
    uv_walk(async->loop, close_handle, nullptr);
}

static void
server_thread(void *data)
{
    auto *loop = static_cast<uv_loop_t *>(data);
    uv_run(loop, UV_RUN_DEFAULT);
}

SandboxTestServer::SandboxTestServer()
    : m_running(false),
      m_port(0)
{
    memset(&m_loop, 0, sizeof(uv_loop_t));
    memset(&m_listener, 0, sizeof(uv_tcp_t));
    memset(&m_stopAsync, 0, sizeof(uv_async_t));
}

SandboxTestServer::~SandboxTestServer()
{
    stop();
}

tempo_utils::Status
SandboxTestServer::start()
{
    if (m_running)
        return tempo_utils::GenericStatus::forCondition(
            tempo_utils::GenericCondition::kInternalViolation, "server is already running");

    int ret = uv_loop_init(&m_loop);
    if (ret < 0)
        return tempo_utils::GenericStatus::forCondition(
            tempo_utils::GenericCondition::kInternalViolation, "uv_loop_init failed: {}", uv_strerror(ret));
    m_loop.data = this;

    uv_tcp_init(&m_loop, &m_listener);
    m_listener.data = nullptr;
    uv_async_init(&m_loop, &m_stopAsync, on_stop);
    m_stopAsync.data = nullptr;

    sockaddr_in addr;
    memset(&addr, 0, sizeof(sockaddr_in));
    uv_ip4_addr("127.0.0.1", 0, &addr);

    ret = uv_tcp_bind(&m_listener, (const sockaddr *) &addr, 0);
    if (ret == 0) {
        ret = uv_listen((uv_stream_t *) &m_listener, 16, on_new_connection);
    }
    if (ret < 0) {
        uv_walk(&m_loop, close_handle, nullptr);
        uv_run(&m_loop, UV_RUN_DEFAULT);
        uv_loop_close(&m_loop);
        return tempo_utils::GenericStatus::forCondition(
            tempo_utils::GenericCondition::kInternalViolation, "failed to listen: {}", uv_strerror(ret));
    }

    sockaddr_storage bound;
    int boundLength = sizeof(sockaddr_storage);
    uv_tcp_getsockname(&m_listener, (sockaddr *) &bound, &boundLength);
    m_port = ntohs(((sockaddr_in *) &bound)->sin_port);

    uv_thread_create(&m_tid, server_thread, &m_loop);
    m_running = true;
    TU_LOG_V << "test server listening on " << getBaseUrl();
    return {};
}

void
SandboxTestServer::stop()
{
    if (!m_running)
        return;
    uv_async_send(&m_stopAsync);
    uv_thread_join(&m_tid);
    auto ret = uv_loop_close(&m_loop);
    TU_LOG_ERROR_IF(ret < 0) << "failed to close loop: " << uv_strerror(ret);
    m_running = false;
}

int
SandboxTestServer::getPort() const
{
    return m_port;
}

std::string
SandboxTestServer::getBaseUrl() const
{
    return absl::StrCat("http://127.0.0.1:", m_port);
}

void
SandboxTestServer::addResponse(
    std::string_view method,
    std::string_view path,
    const CannedResponse &response)
{
    absl::MutexLock locker(&m_lock);
    m_responses[absl::StrCat(method, " ", path)].push_back(response);
}

std::vector<RecordedRequest>
SandboxTestServer::getRequests() const
{
    absl::MutexLock locker(&m_lock);
    return m_requests;
}

/**
 * Record the request and select the response for it.
 *
 * @return true if a response is registered for the request, otherwise false.
 */
bool
SandboxTestServer::recordRequest(const RecordedRequest &request, CannedResponse &response)
{
    absl::MutexLock locker(&m_lock);
    m_requests.push_back(request);

    auto entry = m_responses.find(absl::StrCat(request.method, " ", request.path));
    if (entry == m_responses.cend() || entry->second.empty())
        return false;
    auto &queue = entry->second;
    response = queue.front();
    if (queue.size() > 1) {
        queue.pop_front();
    }
    return true;
}
