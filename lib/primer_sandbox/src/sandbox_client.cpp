
#include <algorithm>

#include <absl/strings/str_cat.h>
#include <absl/strings/strip.h>

#include <primer_common/primer_result.h>
#include <primer_sandbox/internal/curl_utils.h>
#include <primer_sandbox/internal/submission_codec.h>
#include <primer_sandbox/sandbox_client.h>
#include <tempo_utils/file_reader.h>
#include <tempo_utils/log_stream.h>

static bool
is_success_code(long responseCode)
{
    return 200 <= responseCode && responseCode < 300;
}

primer_sandbox::SandboxClient::SandboxClient(const SandboxClientOptions &options)
    : m_options(options)
{
    std::string_view baseUrl = m_options.baseUrl;
    while (absl::ConsumeSuffix(&baseUrl, "/")) {}
    m_baseUrl = std::string(baseUrl);
    TU_ASSERT (!m_baseUrl.empty());
}

std::string
primer_sandbox::SandboxClient::getBaseUrl() const
{
    return m_baseUrl;
}

bool
primer_sandbox::SandboxClient::isRecognizedLanguage(int languageId) const
{
    return m_options.languageIds.contains(languageId);
}

tempo_utils::Result<primer_sandbox::SubmissionHandle>
primer_sandbox::SandboxClient::submit(std::string_view sourceCode, int languageId)
{
    if (sourceCode.empty())
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kInvalidInput, "source code is empty");
    if (!isRecognizedLanguage(languageId))
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kInvalidInput,
            "language id {} is not recognized", languageId);

    internal::HttpRequest request;
    request.method = internal::HttpMethod::Post;
    request.url = absl::StrCat(m_baseUrl, "/submissions?base64_encoded=false&wait=false");
    request.headers = {"Content-Type: application/json", "Accept: application/json"};
    request.entity = internal::encode_submission_request(sourceCode, languageId);
    request.timeout = m_options.requestTimeout;

    internal::HttpResponse response;
    TU_ASSIGN_OR_RETURN (response, internal::perform_request(request));

    // the service rejects malformed submissions with a client error
    if (400 <= response.responseCode && response.responseCode < 500)
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kInvalidInput,
            "submission was rejected with status {}: {}", response.responseCode, response.entity);
    if (!is_success_code(response.responseCode))
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kServiceUnavailable,
            "submission failed with status {}", response.responseCode);

    SubmissionHandle handle;
    TU_ASSIGN_OR_RETURN (handle, internal::decode_submission_token(response.entity));
    TU_LOG_INFO << "created submission " << handle.getToken() << " at " << m_baseUrl;
    return handle;
}

tempo_utils::Result<primer_sandbox::PollResult>
primer_sandbox::SandboxClient::poll(SubmissionHandle &handle)
{
    return poll(handle, m_options.requestTimeout);
}

tempo_utils::Result<primer_sandbox::PollResult>
primer_sandbox::SandboxClient::poll(SubmissionHandle &handle, absl::Duration timeout)
{
    if (!handle.isValid())
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kInvalidInput, "invalid submission handle");
    if (handle.isConsumed())
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kInvalidInput,
            "submission handle {} was already consumed", handle.getToken());

    internal::HttpRequest request;
    request.method = internal::HttpMethod::Get;
    request.url = absl::StrCat(m_baseUrl, "/submissions/", handle.getToken(), "?base64_encoded=false");
    request.headers = {"Accept: application/json"};
    request.timeout = std::min(m_options.requestTimeout, timeout);

    internal::HttpResponse response;
    TU_ASSIGN_OR_RETURN (response, internal::perform_request(request));
    if (!is_success_code(response.responseCode))
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kServiceUnavailable,
            "poll of submission {} failed with status {}", handle.getToken(), response.responseCode);

    PollResult pollResult;
    TU_ASSIGN_OR_RETURN (pollResult, internal::decode_submission_status(response.entity));
    if (pollResult.isTerminal()) {
        handle.consume();
        TU_LOG_INFO << "submission " << handle.getToken() << " finished with status "
            << primer_common::execution_status_to_string(pollResult.getResult().getStatus());
    }
    return pollResult;
}

bool
primer_sandbox::SandboxClient::healthCheck()
{
    internal::HttpRequest request;
    request.method = internal::HttpMethod::Get;
    request.url = absl::StrCat(m_baseUrl, "/about");
    request.timeout = m_options.healthCheckTimeout;

    auto performResult = internal::perform_request(request);
    if (performResult.isStatus()) {
        TU_LOG_WARN << "health check failed: " << performResult.getStatus();
        return false;
    }
    auto response = performResult.getResult();
    if (response.responseCode != 200) {
        TU_LOG_WARN << "health check returned status " << (int) response.responseCode;
        return false;
    }
    return true;
}

/**
 * Read the script at the specified path and submit its contents.
 *
 * @param scriptPath Path to the script.
 * @param languageId The sandbox language identifier.
 * @return The submission handle, or NotFound status if the script does not exist.
 */
tempo_utils::Result<primer_sandbox::SubmissionHandle>
primer_sandbox::SandboxClient::submitFile(const std::filesystem::path &scriptPath, int languageId)
{
    if (!std::filesystem::is_regular_file(scriptPath))
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kNotFound,
            "script {} not found", scriptPath.string());

    tempo_utils::FileReader scriptReader(scriptPath);
    if (!scriptReader.isValid())
        return scriptReader.getStatus();
    auto scriptBytes = scriptReader.getBytes();
    std::string sourceCode((const char *) scriptBytes->getData(), scriptBytes->getSize());

    return submit(sourceCode, languageId);
}

tempo_utils::Result<std::vector<primer_sandbox::SandboxLanguage>>
primer_sandbox::SandboxClient::listLanguages()
{
    internal::HttpRequest request;
    request.method = internal::HttpMethod::Get;
    request.url = absl::StrCat(m_baseUrl, "/languages");
    request.headers = {"Accept: application/json"};
    request.timeout = m_options.requestTimeout;

    internal::HttpResponse response;
    TU_ASSIGN_OR_RETURN (response, internal::perform_request(request));
    if (!is_success_code(response.responseCode))
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kServiceUnavailable,
            "list languages failed with status {}", response.responseCode);

    return internal::decode_language_list(response.entity);
}
