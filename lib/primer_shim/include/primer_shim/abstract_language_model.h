#ifndef PRIMER_SHIM_ABSTRACT_LANGUAGE_MODEL_H
#define PRIMER_SHIM_ABSTRACT_LANGUAGE_MODEL_H

#include <tempo_utils/result.h>

#include "shim_types.h"

namespace primer_shim {

    class AbstractLanguageModel {
    public:
        virtual ~AbstractLanguageModel() = default;

        /**
         * Generate a response for the specified request.
         *
         * @param request The request, carrying either a prompt or a message list.
         * @return The response, or InvalidInput if the request carries neither or both.
         */
        virtual tempo_utils::Result<ModelResponse> generate(const GenerateRequest &request) = 0;
    };
}

#endif // PRIMER_SHIM_ABSTRACT_LANGUAGE_MODEL_H
