#ifndef PRIMER_SHIM_MOCK_LANGUAGE_MODEL_H
#define PRIMER_SHIM_MOCK_LANGUAGE_MODEL_H

#include <memory>
#include <vector>

#include <absl/synchronization/mutex.h>
#include <absl/time/time.h>

#include "abstract_language_model.h"

namespace primer_shim {

    constexpr const char *kMockModelName = "mock-model";

    struct ResponsePattern {
        ResponseCategory category;
        std::vector<std::string> keywords;
        std::string response;
    };

    struct CallRecord {
        std::string prompt;
        std::string response;
        absl::Time timestamp;
    };

    /**
     * Deterministic offline language model. The response text is chosen by matching the
     * prompt against an ordered table of keyword patterns; the first matching pattern wins.
     */
    class MockLanguageModel : public AbstractLanguageModel {
    public:
        MockLanguageModel();
        explicit MockLanguageModel(std::string_view modelName);

        std::string getModelName() const;

        tempo_utils::Result<ModelResponse> generate(const GenerateRequest &request) override;

        std::vector<CallRecord> getCallHistory() const;

    private:
        std::string m_modelName;

        mutable absl::Mutex m_lock;
        std::vector<CallRecord> m_callHistory ABSL_GUARDED_BY(m_lock);
    };

    const std::vector<ResponsePattern> &default_response_patterns();

    int count_whitespace_tokens(std::string_view text);

    std::shared_ptr<AbstractLanguageModel> select_language_model(
        std::shared_ptr<AbstractLanguageModel> configuredModel);
}

#endif // PRIMER_SHIM_MOCK_LANGUAGE_MODEL_H
