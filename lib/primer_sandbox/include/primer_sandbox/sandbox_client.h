#ifndef PRIMER_SANDBOX_SANDBOX_CLIENT_H
#define PRIMER_SANDBOX_SANDBOX_CLIENT_H

#include <filesystem>

#include <absl/container/flat_hash_set.h>
#include <absl/time/time.h>

#include "abstract_sandbox_client.h"

namespace primer_sandbox {

    constexpr const char *kDefaultSandboxUrl = "http://localhost:2358";

    struct SandboxClientOptions {
        std::string baseUrl = kDefaultSandboxUrl;
        absl::Duration requestTimeout = absl::Seconds(30);
        absl::Duration healthCheckTimeout = absl::Seconds(5);
        absl::flat_hash_set<int> languageIds = {kPythonLanguageId};
    };

    /**
     * Client for a Judge0-compatible code execution service.
     */
    class SandboxClient : public AbstractSandboxClient {
    public:
        explicit SandboxClient(const SandboxClientOptions &options = {});

        std::string getBaseUrl() const;
        bool isRecognizedLanguage(int languageId) const;

        tempo_utils::Result<SubmissionHandle> submit(
            std::string_view sourceCode,
            int languageId) override;
        tempo_utils::Result<PollResult> poll(
            SubmissionHandle &handle,
            absl::Duration timeout) override;
        tempo_utils::Result<PollResult> poll(SubmissionHandle &handle);
        bool healthCheck() override;

        tempo_utils::Result<SubmissionHandle> submitFile(
            const std::filesystem::path &scriptPath,
            int languageId);
        tempo_utils::Result<std::vector<SandboxLanguage>> listLanguages();

    private:
        SandboxClientOptions m_options;
        std::string m_baseUrl;
    };
}

#endif // PRIMER_SANDBOX_SANDBOX_CLIENT_H
