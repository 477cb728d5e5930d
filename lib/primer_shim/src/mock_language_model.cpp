
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <absl/time/clock.h>

#include <primer_common/primer_result.h>
#include <primer_shim/mock_language_model.h>
#include <tempo_utils/log_stream.h>

primer_shim::MockLanguageModel::MockLanguageModel()
    : m_modelName(kMockModelName)
{
}

primer_shim::MockLanguageModel::MockLanguageModel(std::string_view modelName)
    : m_modelName(modelName)
{
    TU_ASSERT (!m_modelName.empty());
}

std::string
primer_shim::MockLanguageModel::getModelName() const
{
    return m_modelName;
}

const std::vector<primer_shim::ResponsePattern> &
primer_shim::default_response_patterns()
{
    static const std::vector<ResponsePattern> patterns = {
        {ResponseCategory::Greet, {"greet", "greeting"},
            "Hello, Alice! It's wonderful to meet you!"},
        {ResponseCategory::Summarize, {"summarize", "summary"},
            "Summary: The text discusses key concepts in a concise manner."},
        {ResponseCategory::Extract, {"extract"},
            "Extracted entities: Name: Alice, Age: 30, Occupation: Engineer"},
        {ResponseCategory::Classify, {"classify", "sentiment"},
            "Classification: Positive"},
        {ResponseCategory::Translate, {"translate"},
            "Translation: Bonjour le monde"},
        {ResponseCategory::Explain, {"explain"},
            "Explanation: This concept can be understood by breaking it down into simpler parts."},
    };
    return patterns;
}

/**
 * Count the whitespace separated tokens in the specified text. This approximates a token
 * count without a tokenizer.
 *
 * @param text The text.
 * @return The number of tokens.
 */
int
primer_shim::count_whitespace_tokens(std::string_view text)
{
    std::vector<std::string_view> tokens = absl::StrSplit(
        text, absl::ByAnyChar(" \t\n\r\f\v"), absl::SkipEmpty());
    return static_cast<int>(tokens.size());
}

static tempo_utils::Result<std::string>
effective_prompt(const primer_shim::GenerateRequest &request)
{
    bool hasPrompt = !request.prompt.isEmpty() && !request.prompt.getValue().empty();
    bool hasMessages = !request.messages.empty();

    if (hasPrompt && hasMessages)
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kInvalidInput,
            "request must specify either a prompt or messages, not both");
    if (hasPrompt)
        return request.prompt.getValue();
    if (hasMessages) {
        // roles are ignored, the message contents form a single prompt
        return absl::StrJoin(request.messages, " ",
            [](std::string *out, const primer_shim::ChatMessage &message) {
                absl::StrAppend(out, message.content);
            });
    }
    return primer_common::PrimerStatus::forCondition(
        primer_common::PrimerCondition::kInvalidInput,
        "request must specify either a prompt or messages");
}

tempo_utils::Result<primer_shim::ModelResponse>
primer_shim::MockLanguageModel::generate(const GenerateRequest &request)
{
    std::string prompt;
    TU_ASSIGN_OR_RETURN (prompt, effective_prompt(request));

    auto lowered = absl::AsciiStrToLower(prompt);
    auto category = ResponseCategory::Fallback;
    std::string text;

    for (const auto &pattern : default_response_patterns()) {
        bool matched = false;
        for (const auto &keyword : pattern.keywords) {
            if (absl::StrContains(lowered, keyword)) {
                matched = true;
                break;
            }
        }
        if (matched) {
            category = pattern.category;
            text = pattern.response;
            break;
        }
    }

    if (category == ResponseCategory::Fallback) {
        text = absl::StrCat("This is a mock response for demonstration. You said: ", prompt);
    }

    TU_LOG_V << "mock model matched category " << response_category_to_string(category);

    ModelUsage usage(count_whitespace_tokens(prompt), count_whitespace_tokens(text));
    ModelResponse response(ChoiceList({ModelChoice(text)}), usage, category, m_modelName);

    absl::MutexLock locker(&m_lock);
    m_callHistory.push_back(CallRecord{prompt, text, absl::Now()});

    return response;
}

/**
 * Returns a snapshot of every successful call made to the model, in call order.
 */
std::vector<primer_shim::CallRecord>
primer_shim::MockLanguageModel::getCallHistory() const
{
    absl::MutexLock locker(&m_lock);
    return m_callHistory;
}

/**
 * Select the language model used by lesson code. The configured model is used when one is
 * given, otherwise calls are routed to a MockLanguageModel.
 *
 * @param configuredModel The configured model, which may be null.
 * @return The selected model.
 */
std::shared_ptr<primer_shim::AbstractLanguageModel>
primer_shim::select_language_model(std::shared_ptr<AbstractLanguageModel> configuredModel)
{
    if (configuredModel != nullptr)
        return configuredModel;
    TU_LOG_INFO << "no language model configured, using " << kMockModelName;
    return std::make_shared<MockLanguageModel>();
}
