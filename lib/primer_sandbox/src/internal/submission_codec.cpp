
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <nlohmann/json.hpp>

#include <primer_common/primer_result.h>
#include <primer_sandbox/internal/submission_codec.h>
#include <tempo_utils/log_stream.h>

std::string
primer_sandbox::internal::encode_submission_request(
    std::string_view sourceCode,
    int languageId,
    std::string_view stdinData)
{
    nlohmann::json request = {
        {"source_code", std::string(sourceCode)},
        {"language_id", languageId},
        {"stdin", std::string(stdinData)},
    };
    return request.dump();
}

static tempo_utils::Status
parse_entity(std::string_view entity, std::string_view what, nlohmann::json &root)
{
    root = nlohmann::json::parse(entity, nullptr, false);
    if (root.is_discarded())
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kServiceUnavailable,
            "failed to parse {} response", what);
    return {};
}

// null and missing text fields are both treated as empty
static std::string
get_text_field(const nlohmann::json &object, const char *key)
{
    auto entry = object.find(key);
    if (entry == object.end() || !entry->is_string())
        return {};
    return entry->get<std::string>();
}

tempo_utils::Result<primer_sandbox::SubmissionHandle>
primer_sandbox::internal::decode_submission_token(std::string_view entity)
{
    nlohmann::json root;
    TU_RETURN_IF_NOT_OK (parse_entity(entity, "submission", root));
    if (!root.is_object())
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kServiceUnavailable,
            "invalid submission response; expected an object");

    auto token = get_text_field(root, "token");
    if (token.empty())
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kServiceUnavailable,
            "invalid submission response; missing token");

    return SubmissionHandle(token);
}

/**
 * Decode the submission status document returned by the sandbox service. Statuses In Queue and
 * Processing are pending, Accepted is a success and Time Limit Exceeded is a timeout. Every
 * other status, including the compilation, runtime and internal error statuses, is a
 * failure. Unrecognized fields are ignored.
 *
 * @param entity The response entity.
 * @return The poll result, or ServiceUnavailable status if the entity could not be decoded.
 */
tempo_utils::Result<primer_sandbox::PollResult>
primer_sandbox::internal::decode_submission_status(std::string_view entity)
{
    nlohmann::json root;
    TU_RETURN_IF_NOT_OK (parse_entity(entity, "submission status", root));
    if (!root.is_object())
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kServiceUnavailable,
            "invalid submission status response; expected an object");

    auto status = root.find("status");
    if (status == root.end() || !status->is_object())
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kServiceUnavailable,
            "invalid submission status response; missing status");
    auto statusId = status->find("id");
    if (statusId == status->end() || !statusId->is_number_integer())
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kServiceUnavailable,
            "invalid submission status response; missing status id");
    auto id = statusId->get<int>();
    auto description = get_text_field(*status, "description");

    switch (id) {
        case static_cast<int>(SubmissionStatusId::InQueue):
        case static_cast<int>(SubmissionStatusId::Processing):
            return PollResult::pending();
        default:
            break;
    }

    auto out = get_text_field(root, "stdout");
    auto err = get_text_field(root, "stderr");

    // compiler diagnostics stand in for the error output when the script wrote none
    if (err.empty()) {
        err = get_text_field(root, "compile_output");
    }

    // time is reported as a decimal string of seconds
    absl::Duration duration = absl::ZeroDuration();
    double seconds;
    auto time = get_text_field(root, "time");
    if (!time.empty() && absl::SimpleAtod(time, &seconds)) {
        duration = absl::Seconds(seconds);
    }

    Option<int> exitCode;
    auto exitCodeEntry = root.find("exit_code");
    if (exitCodeEntry != root.end() && exitCodeEntry->is_number_integer()) {
        exitCode = Option<int>(exitCodeEntry->get<int>());
    }

    auto message = description;
    auto detail = get_text_field(root, "message");
    if (!detail.empty()) {
        message = absl::StrCat(description, ": ", detail);
    }

    switch (id) {
        case static_cast<int>(SubmissionStatusId::Accepted):
            return PollResult::terminal(primer_common::ExecutionResult::succeeded(
                out, err, duration, primer_common::BackendType::Remote));
        case static_cast<int>(SubmissionStatusId::TimeLimitExceeded):
            return PollResult::terminal(primer_common::ExecutionResult::timedOut(
                out, err, duration, primer_common::BackendType::Remote, message));
        default:
            TU_LOG_V << "submission finished with status " << id << " (" << description << ")";
            return PollResult::terminal(primer_common::ExecutionResult::failed(
                out, err, exitCode, duration, primer_common::BackendType::Remote, message));
    }
}

tempo_utils::Result<std::vector<primer_sandbox::SandboxLanguage>>
primer_sandbox::internal::decode_language_list(std::string_view entity)
{
    nlohmann::json root;
    TU_RETURN_IF_NOT_OK (parse_entity(entity, "language list", root));
    if (!root.is_array())
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kServiceUnavailable,
            "invalid language list response; expected an array");

    std::vector<SandboxLanguage> languages;
    for (const auto &element : root) {
        if (!element.is_object())
            continue;
        auto id = element.find("id");
        if (id == element.end() || !id->is_number_integer())
            continue;
        languages.push_back(SandboxLanguage{id->get<int>(), get_text_field(element, "name")});
    }
    return languages;
}
