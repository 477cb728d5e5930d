#ifndef PRIMER_COMMON_PRIMER_RESULT_H
#define PRIMER_COMMON_PRIMER_RESULT_H

#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

#include <tempo_utils/log_stream.h>
#include <tempo_utils/status.h>

namespace primer_common {

    constexpr const char *kPrimerStatusNs("dev.primer.ns:primer-status-1");

    enum class PrimerCondition {
        kInvalidInput,
        kNotFound,
        kLessonNotFound,
        kServiceUnavailable,
        kTimedOut,
        kProcessFailure,
        kPrimerInvariant,
    };

    class PrimerStatus : public tempo_utils::TypedStatus<PrimerCondition> {
    public:
        using TypedStatus::TypedStatus;
        static bool convert(PrimerStatus &dstStatus, const tempo_utils::Status &srcStatus);

    private:
        PrimerStatus(tempo_utils::StatusCode statusCode, std::shared_ptr<const tempo_utils::Detail> detail);

    public:
        /**
         *
         * @param condition
         * @param message
         * @return
         */
        static PrimerStatus forCondition(
            PrimerCondition condition,
            std::string_view message)
        {
            return PrimerStatus(condition, message);
        }
        /**
         *
         * @tparam Args
         * @param condition
         * @param messageFmt
         * @param messageArgs
         * @return
         */
        template <typename... Args>
        static PrimerStatus forCondition(
            PrimerCondition condition,
            fmt::string_view messageFmt = {},
            Args... messageArgs)
        {
            auto message = fmt::vformat(messageFmt, fmt::make_format_args(messageArgs...));
            return PrimerStatus(condition, message);
        }
    };
}

namespace tempo_utils {

    template<>
    struct StatusTraits<primer_common::PrimerCondition> {
        using ConditionType = primer_common::PrimerCondition;
        static bool convert(primer_common::PrimerStatus &dstStatus, const tempo_utils::Status &srcStatus)
        {
            return primer_common::PrimerStatus::convert(dstStatus, srcStatus);
        }
    };

    template<>
    struct ConditionTraits<primer_common::PrimerCondition> {
        using StatusType = primer_common::PrimerStatus;
        static constexpr const char *condition_namespace() { return primer_common::kPrimerStatusNs; }
        static constexpr StatusCode make_status_code(primer_common::PrimerCondition condition)
        {
            switch (condition) {
                case primer_common::PrimerCondition::kInvalidInput:
                    return tempo_utils::StatusCode::kInvalidArgument;
                case primer_common::PrimerCondition::kNotFound:
                case primer_common::PrimerCondition::kLessonNotFound:
                    return tempo_utils::StatusCode::kNotFound;
                case primer_common::PrimerCondition::kServiceUnavailable:
                    return tempo_utils::StatusCode::kUnavailable;
                case primer_common::PrimerCondition::kTimedOut:
                    return tempo_utils::StatusCode::kDeadlineExceeded;
                case primer_common::PrimerCondition::kProcessFailure:
                case primer_common::PrimerCondition::kPrimerInvariant:
                    return tempo_utils::StatusCode::kInternal;
                default:
                    return tempo_utils::StatusCode::kUnknown;
            }
        };
        static constexpr const char *make_error_message(primer_common::PrimerCondition condition)
        {
            switch (condition) {
                case primer_common::PrimerCondition::kInvalidInput:
                    return "Invalid input";
                case primer_common::PrimerCondition::kNotFound:
                    return "Not found";
                case primer_common::PrimerCondition::kLessonNotFound:
                    return "Lesson not found";
                case primer_common::PrimerCondition::kServiceUnavailable:
                    return "Service unavailable";
                case primer_common::PrimerCondition::kTimedOut:
                    return "Timed out";
                case primer_common::PrimerCondition::kProcessFailure:
                    return "Process failure";
                case primer_common::PrimerCondition::kPrimerInvariant:
                    return "Primer invariant";
                default:
                    return "INVALID";
            }
        }
    };
}

#endif // PRIMER_COMMON_PRIMER_RESULT_H
