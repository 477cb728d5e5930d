#ifndef PRIMER_SANDBOX_INTERNAL_CURL_UTILS_H
#define PRIMER_SANDBOX_INTERNAL_CURL_UTILS_H

#include <string>
#include <vector>

#include <absl/time/time.h>
#include <curl/curl.h>

#include <tempo_utils/result.h>

namespace primer_sandbox::internal {

    enum class HttpMethod {
        Get,
        Post,
    };

    struct HttpRequest {
        HttpMethod method = HttpMethod::Get;
        std::string url;
        std::vector<std::string> headers;
        std::string entity;
        absl::Duration timeout = absl::Seconds(30);
    };

    struct HttpResponse {
        long responseCode = 0;
        std::string entity;
    };

    size_t entity_write_cb(char *buffer, size_t size, size_t nmemb, void *_response);

    tempo_utils::Result<HttpResponse> perform_request(const HttpRequest &request);
}

#endif // PRIMER_SANDBOX_INTERNAL_CURL_UTILS_H
