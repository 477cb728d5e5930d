
#include <primer_shim/shim_types.h>
#include <tempo_utils/log_stream.h>

const char *
primer_shim::response_category_to_string(ResponseCategory category)
{
    switch (category) {
        case ResponseCategory::Greet:
            return "greet";
        case ResponseCategory::Summarize:
            return "summarize";
        case ResponseCategory::Extract:
            return "extract";
        case ResponseCategory::Classify:
            return "classify";
        case ResponseCategory::Translate:
            return "translate";
        case ResponseCategory::Explain:
            return "explain";
        case ResponseCategory::Fallback:
            return "fallback";
        default:
            return "invalid";
    }
}

primer_shim::ModelChoice::ModelChoice()
{
}

primer_shim::ModelChoice::ModelChoice(std::string_view text, std::string_view finishReason)
    : m_text(text),
      m_finishReason(finishReason)
{
}

primer_shim::ModelChoice::ModelChoice(const ModelChoice &other)
    : m_text(other.m_text),
      m_finishReason(other.m_finishReason)
{
}

std::string
primer_shim::ModelChoice::getText() const
{
    return m_text;
}

std::string
primer_shim::ModelChoice::getFinishReason() const
{
    return m_finishReason;
}

int
primer_shim::ModelChoice::size() const
{
    return 1;
}

/**
 * Positional access to the choice text, for callers which index into a choice rather than
 * reading the text field.
 *
 * @param index The position, which must be 0.
 * @return The choice text.
 */
std::string
primer_shim::ModelChoice::operator[](int index) const
{
    TU_ASSERT (index == 0);
    return m_text;
}

primer_shim::ChoiceList::ChoiceList()
{
}

primer_shim::ChoiceList::ChoiceList(std::vector<ModelChoice> choices)
    : m_choices(std::move(choices))
{
}

primer_shim::ChoiceList::ChoiceList(const ChoiceList &other)
    : m_choices(other.m_choices)
{
}

bool
primer_shim::ChoiceList::isEmpty() const
{
    return m_choices.empty();
}

int
primer_shim::ChoiceList::size() const
{
    return static_cast<int>(m_choices.size());
}

const primer_shim::ModelChoice &
primer_shim::ChoiceList::operator[](int index) const
{
    TU_ASSERT (0 <= index && index < static_cast<int>(m_choices.size()));
    return m_choices.at(index);
}

std::vector<primer_shim::ModelChoice>::const_iterator
primer_shim::ChoiceList::begin() const
{
    return m_choices.cbegin();
}

std::vector<primer_shim::ModelChoice>::const_iterator
primer_shim::ChoiceList::end() const
{
    return m_choices.cend();
}

primer_shim::ModelUsage::ModelUsage()
    : m_promptTokens(0),
      m_completionTokens(0)
{
}

primer_shim::ModelUsage::ModelUsage(int promptTokens, int completionTokens)
    : m_promptTokens(promptTokens),
      m_completionTokens(completionTokens)
{
    TU_ASSERT (m_promptTokens >= 0);
    TU_ASSERT (m_completionTokens >= 0);
}

primer_shim::ModelUsage::ModelUsage(const ModelUsage &other)
    : m_promptTokens(other.m_promptTokens),
      m_completionTokens(other.m_completionTokens)
{
}

int
primer_shim::ModelUsage::getPromptTokens() const
{
    return m_promptTokens;
}

int
primer_shim::ModelUsage::getCompletionTokens() const
{
    return m_completionTokens;
}

int
primer_shim::ModelUsage::getTotalTokens() const
{
    return m_promptTokens + m_completionTokens;
}

primer_shim::ModelResponse::ModelResponse()
    : m_category(ResponseCategory::Invalid)
{
}

primer_shim::ModelResponse::ModelResponse(
    const ChoiceList &choices,
    const ModelUsage &usage,
    ResponseCategory category,
    std::string_view model)
    : m_choices(choices),
      m_usage(usage),
      m_category(category),
      m_model(model)
{
    TU_ASSERT (!m_choices.isEmpty());
    TU_ASSERT (m_category != ResponseCategory::Invalid);
}

primer_shim::ModelResponse::ModelResponse(const ModelResponse &other)
    : m_choices(other.m_choices),
      m_usage(other.m_usage),
      m_category(other.m_category),
      m_model(other.m_model)
{
}

bool
primer_shim::ModelResponse::isValid() const
{
    return m_category != ResponseCategory::Invalid;
}

primer_shim::ChoiceList
primer_shim::ModelResponse::getChoices() const
{
    return m_choices;
}

primer_shim::ModelUsage
primer_shim::ModelResponse::getUsage() const
{
    return m_usage;
}

primer_shim::ResponseCategory
primer_shim::ModelResponse::getCategory() const
{
    return m_category;
}

std::string
primer_shim::ModelResponse::getModel() const
{
    return m_model;
}

/**
 * Convenience accessor returning the text of the first choice, or an empty string if the
 * response is not valid.
 */
std::string
primer_shim::ModelResponse::getText() const
{
    if (m_choices.isEmpty())
        return {};
    return m_choices[0].getText();
}
