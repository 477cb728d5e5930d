#ifndef PRIMER_COMMON_COMMON_CONVERSIONS_H
#define PRIMER_COMMON_COMMON_CONVERSIONS_H

#include <tempo_config/enum_conversions.h>

#include "execution_types.h"

namespace primer_common {

    class BackendTypeParser : public tempo_config::EnumTParser<BackendType> {
    public:
        explicit BackendTypeParser(BackendType defaultType)
            : EnumTParser({
            {"Local", BackendType::Local},
            {"Remote", BackendType::Remote}}, defaultType)
        {}
        BackendTypeParser() : BackendTypeParser(BackendType::Invalid)
        {}
    };
}

#endif // PRIMER_COMMON_COMMON_CONVERSIONS_H
