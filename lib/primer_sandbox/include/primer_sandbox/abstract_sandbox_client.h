#ifndef PRIMER_SANDBOX_ABSTRACT_SANDBOX_CLIENT_H
#define PRIMER_SANDBOX_ABSTRACT_SANDBOX_CLIENT_H

#include <absl/time/time.h>

#include <tempo_utils/result.h>

#include "sandbox_types.h"

namespace primer_sandbox {

    class AbstractSandboxClient {
    public:
        virtual ~AbstractSandboxClient() = default;

        /**
         * Submit source code for execution.
         *
         * @param sourceCode The script source.
         * @param languageId The sandbox language identifier.
         * @return The submission handle, or InvalidInput if the source is empty or the language
         *     is not recognized, or ServiceUnavailable if the service cannot be reached.
         */
        virtual tempo_utils::Result<SubmissionHandle> submit(
            std::string_view sourceCode,
            int languageId) = 0;

        /**
         * Poll the status of a submission. Blocks for at most one request round trip, which is
         * bounded by the specified timeout.
         *
         * @param handle The submission handle, which is consumed if the poll result is terminal.
         * @param timeout Upper bound on the time spent in the request.
         * @return The poll result, or TimedOut status if the service did not answer in time.
         */
        virtual tempo_utils::Result<PollResult> poll(
            SubmissionHandle &handle,
            absl::Duration timeout) = 0;

        /**
         * Returns true if the service answered the liveness probe within the health check timeout.
         */
        virtual bool healthCheck() = 0;
    };
}

#endif // PRIMER_SANDBOX_ABSTRACT_SANDBOX_CLIENT_H
