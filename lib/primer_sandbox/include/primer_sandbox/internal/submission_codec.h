#ifndef PRIMER_SANDBOX_INTERNAL_SUBMISSION_CODEC_H
#define PRIMER_SANDBOX_INTERNAL_SUBMISSION_CODEC_H

#include <tempo_utils/result.h>

#include <primer_sandbox/sandbox_types.h>

namespace primer_sandbox::internal {

    enum class SubmissionStatusId {
        InQueue = 1,
        Processing = 2,
        Accepted = 3,
        TimeLimitExceeded = 5,
    };

    std::string encode_submission_request(
        std::string_view sourceCode,
        int languageId,
        std::string_view stdinData = {});

    tempo_utils::Result<SubmissionHandle> decode_submission_token(std::string_view entity);

    tempo_utils::Result<PollResult> decode_submission_status(std::string_view entity);

    tempo_utils::Result<std::vector<SandboxLanguage>> decode_language_list(std::string_view entity);
}

#endif // PRIMER_SANDBOX_INTERNAL_SUBMISSION_CODEC_H
