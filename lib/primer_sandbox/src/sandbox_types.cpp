
#include <primer_sandbox/sandbox_types.h>
#include <tempo_utils/log_stream.h>

primer_sandbox::SubmissionHandle::SubmissionHandle()
    : m_consumed(true)
{
}

primer_sandbox::SubmissionHandle::SubmissionHandle(std::string_view token)
    : m_token(token),
      m_consumed(false)
{
    TU_ASSERT (!m_token.empty());
}

primer_sandbox::SubmissionHandle::SubmissionHandle(const SubmissionHandle &other)
    : m_token(other.m_token),
      m_consumed(other.m_consumed)
{
}

bool
primer_sandbox::SubmissionHandle::isValid() const
{
    return !m_token.empty();
}

bool
primer_sandbox::SubmissionHandle::isConsumed() const
{
    return m_consumed;
}

std::string
primer_sandbox::SubmissionHandle::getToken() const
{
    return m_token;
}

/**
 * Mark the handle as consumed. Consuming a handle more than once has no effect.
 */
void
primer_sandbox::SubmissionHandle::consume()
{
    m_consumed = true;
}

primer_sandbox::PollResult::PollResult()
    : m_pending(true)
{
}

primer_sandbox::PollResult::PollResult(const PollResult &other)
    : m_pending(other.m_pending),
      m_result(other.m_result)
{
}

bool
primer_sandbox::PollResult::isPending() const
{
    return m_pending;
}

bool
primer_sandbox::PollResult::isTerminal() const
{
    return !m_pending;
}

primer_common::ExecutionResult
primer_sandbox::PollResult::getResult() const
{
    return m_result;
}

primer_sandbox::PollResult
primer_sandbox::PollResult::pending()
{
    return PollResult();
}

primer_sandbox::PollResult
primer_sandbox::PollResult::terminal(const primer_common::ExecutionResult &result)
{
    TU_ASSERT (result.isValid());
    PollResult pollResult;
    pollResult.m_pending = false;
    pollResult.m_result = result;
    return pollResult;
}
