#ifndef PRIMER_SHIM_SHIM_TYPES_H
#define PRIMER_SHIM_SHIM_TYPES_H

#include <string>
#include <vector>

#include <tempo_utils/option_template.h>

namespace primer_shim {

    constexpr const char *kDefaultFinishReason = "stop";

    struct ChatMessage {
        std::string role;
        std::string content;
    };

    /**
     * A generation request. Exactly one of the prompt or the message list must be present,
     * where an empty prompt or an empty message list counts as absent.
     */
    struct GenerateRequest {
        Option<std::string> prompt;
        std::vector<ChatMessage> messages;
    };

    enum class ResponseCategory {
        Invalid,
        Greet,
        Summarize,
        Extract,
        Classify,
        Translate,
        Explain,
        Fallback,               // no keyword matched, the prompt is echoed back
    };

    const char *response_category_to_string(ResponseCategory category);

    /**
     * A single generated choice. The text is reachable both with getText() and by indexing
     * the choice at position 0.
     */
    class ModelChoice {
    public:
        ModelChoice();
        explicit ModelChoice(std::string_view text, std::string_view finishReason = kDefaultFinishReason);
        ModelChoice(const ModelChoice &other);

        std::string getText() const;
        std::string getFinishReason() const;

        int size() const;
        std::string operator[](int index) const;

    private:
        std::string m_text;
        std::string m_finishReason;
    };

    /**
     * Ordered sequence of choices. Iteration visits exactly the elements reachable by index,
     * in index order.
     */
    class ChoiceList {
    public:
        ChoiceList();
        explicit ChoiceList(std::vector<ModelChoice> choices);
        ChoiceList(const ChoiceList &other);

        bool isEmpty() const;
        int size() const;
        const ModelChoice &operator[](int index) const;

        std::vector<ModelChoice>::const_iterator begin() const;
        std::vector<ModelChoice>::const_iterator end() const;

    private:
        std::vector<ModelChoice> m_choices;
    };

    class ModelUsage {
    public:
        ModelUsage();
        ModelUsage(int promptTokens, int completionTokens);
        ModelUsage(const ModelUsage &other);

        int getPromptTokens() const;
        int getCompletionTokens() const;
        int getTotalTokens() const;

    private:
        int m_promptTokens;
        int m_completionTokens;
    };

    class ModelResponse {
    public:
        ModelResponse();
        ModelResponse(
            const ChoiceList &choices,
            const ModelUsage &usage,
            ResponseCategory category,
            std::string_view model);
        ModelResponse(const ModelResponse &other);

        bool isValid() const;
        ChoiceList getChoices() const;
        ModelUsage getUsage() const;
        ResponseCategory getCategory() const;
        std::string getModel() const;

        std::string getText() const;

    private:
        ChoiceList m_choices;
        ModelUsage m_usage;
        ResponseCategory m_category;
        std::string m_model;
    };
}

#endif // PRIMER_SHIM_SHIM_TYPES_H
