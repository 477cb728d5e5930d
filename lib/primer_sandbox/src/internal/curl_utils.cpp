
#include <algorithm>

#include <primer_common/primer_result.h>
#include <primer_sandbox/internal/curl_utils.h>
#include <tempo_utils/log_stream.h>

/**
 * when signaled by curl this callback gets called as soon as there is data received that
 * needs to be saved.
 *
 * @param buffer
 * @param size
 * @param nmemb
 * @param _response
 * @return
 */
size_t
primer_sandbox::internal::entity_write_cb(char *buffer, size_t size, size_t nmemb, void *_response)
{
    auto *response = (HttpResponse *) _response;

    size_t realsize = size * nmemb;
    response->entity.append(buffer, realsize);
    TU_LOG_V << "received entity data (" << (int) realsize << " bytes)";
    return realsize;
}

static const char *
method_to_string(primer_sandbox::internal::HttpMethod method)
{
    switch (method) {
        case primer_sandbox::internal::HttpMethod::Get:
            return "GET";
        case primer_sandbox::internal::HttpMethod::Post:
            return "POST";
    }
    TU_UNREACHABLE();
}

/**
 * Perform a single blocking http request. The total time spent in the request, including
 * connection setup, is bounded by the request timeout.
 *
 * @param request The request to perform.
 * @return The response if the request completed, TimedOut status if the server did not
 *     respond in time, or ServiceUnavailable status if the server could not be reached.
 */
tempo_utils::Result<primer_sandbox::internal::HttpResponse>
primer_sandbox::internal::perform_request(const HttpRequest &request)
{
    static const CURLcode globalInit = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (globalInit != CURLE_OK)
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kPrimerInvariant,
            "curl_global_init failed: {}", curl_easy_strerror(globalInit));

    CURL *easy = curl_easy_init();
    if (easy == nullptr)
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kPrimerInvariant, "failed to create curl handle");

    HttpResponse response;
    curl_slist *requestHeaders = nullptr;

    // set the request method
    if (request.method == HttpMethod::Post) {
        curl_easy_setopt(easy, CURLOPT_POST, 1L);
        curl_easy_setopt(easy, CURLOPT_POSTFIELDS, request.entity.c_str());
        curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE, (long) request.entity.size());
    } else {
        curl_easy_setopt(easy, CURLOPT_HTTPGET, 1L);
    }

    // set curl callbacks
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, entity_write_cb);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, &response);

    // set url
    curl_easy_setopt(easy, CURLOPT_URL, request.url.c_str());

    // bound the total request time, and disable signals so the timeout is thread safe
    long timeoutMs = std::max<long>(1, (long) absl::ToInt64Milliseconds(request.timeout));
    curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);

    // set request headers if specified
    if (!request.headers.empty()) {
        for (const auto &header : request.headers) {
            requestHeaders = curl_slist_append(requestHeaders, header.c_str());
        }
        curl_easy_setopt(easy, CURLOPT_HTTPHEADER, requestHeaders);
    }

    TU_LOG_V << method_to_string(request.method) << " " << request.url;

    auto curlCode = curl_easy_perform(easy);
    if (curlCode == CURLE_OK) {
        curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &response.responseCode);
    }

    curl_slist_free_all(requestHeaders);
    curl_easy_cleanup(easy);

    if (curlCode == CURLE_OPERATION_TIMEDOUT)
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kTimedOut,
            "{} {} timed out after {}", method_to_string(request.method), request.url,
            absl::FormatDuration(request.timeout));
    if (curlCode != CURLE_OK)
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kServiceUnavailable,
            "{} {} failed: {}", method_to_string(request.method), request.url, curl_easy_strerror(curlCode));

    TU_LOG_V << method_to_string(request.method) << " " << request.url
        << " returned " << (int) response.responseCode;

    return response;
}
