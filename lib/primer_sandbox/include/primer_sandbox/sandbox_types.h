#ifndef PRIMER_SANDBOX_SANDBOX_TYPES_H
#define PRIMER_SANDBOX_SANDBOX_TYPES_H

#include <string>

#include <primer_common/execution_types.h>

namespace primer_sandbox {

    constexpr int kPythonLanguageId = 71;

    /**
     * Opaque token identifying a submission accepted by the sandbox service. A handle is
     * consumed once a terminal poll result has been observed or the caller gives up waiting,
     * after which it can no longer be polled.
     */
    class SubmissionHandle {
    public:
        SubmissionHandle();
        explicit SubmissionHandle(std::string_view token);
        SubmissionHandle(const SubmissionHandle &other);

        bool isValid() const;
        bool isConsumed() const;

        std::string getToken() const;

        void consume();

    private:
        std::string m_token;
        bool m_consumed;
    };

    /**
     * The outcome of a single poll. A pending result carries no execution result.
     */
    class PollResult {
    public:
        PollResult();
        PollResult(const PollResult &other);

        bool isPending() const;
        bool isTerminal() const;

        primer_common::ExecutionResult getResult() const;

        static PollResult pending();
        static PollResult terminal(const primer_common::ExecutionResult &result);

    private:
        bool m_pending;
        primer_common::ExecutionResult m_result;
    };

    struct SandboxLanguage {
        int id;
        std::string name;
    };
}

#endif // PRIMER_SANDBOX_SANDBOX_TYPES_H
