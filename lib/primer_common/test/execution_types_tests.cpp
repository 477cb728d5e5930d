#include <gtest/gtest.h>

#include <primer_common/common_conversions.h>
#include <primer_common/execution_types.h>
#include <primer_common/primer_result.h>
#include <tempo_config/config_types.h>
#include <tempo_config/parse_config.h>
#include <tempo_test/tempo_test.h>

TEST(ExecutionTypes, SucceededResultHasZeroExitCode)
{
    auto result = primer_common::ExecutionResult::succeeded("hello\n", "", absl::Milliseconds(5),
        primer_common::BackendType::Local);

    ASSERT_TRUE (result.isValid());
    ASSERT_EQ (primer_common::ExecutionStatus::Succeeded, result.getStatus());
    ASSERT_FALSE (result.getExitCode().isEmpty());
    ASSERT_EQ (0, result.getExitCode().getValue());
    ASSERT_EQ ("hello\n", result.getStdout());
    ASSERT_EQ (primer_common::BackendType::Local, result.getBackendUsed());
}

TEST(ExecutionTypes, BackendUnavailableResultHasNoExitCode)
{
    auto result = primer_common::ExecutionResult::backendUnavailable(
        primer_common::BackendType::Remote, "health check failed");

    ASSERT_EQ (primer_common::ExecutionStatus::BackendUnavailable, result.getStatus());
    ASSERT_TRUE (result.getExitCode().isEmpty());
    ASSERT_EQ ("health check failed", result.getMessage());
    ASSERT_TRUE (result.getStdout().empty());
}

TEST(ExecutionTypes, WithDurationPreservesOtherFields)
{
    auto result = primer_common::ExecutionResult::failed("out", "err", Option<int>(3),
        absl::ZeroDuration(), primer_common::BackendType::Local, "exited with status 3");
    auto updated = result.withDuration(absl::Seconds(2));

    ASSERT_EQ (absl::ZeroDuration(), result.getDuration());
    ASSERT_EQ (absl::Seconds(2), updated.getDuration());
    ASSERT_EQ (primer_common::ExecutionStatus::Failed, updated.getStatus());
    ASSERT_EQ (3, updated.getExitCode().getValue());
    ASSERT_EQ ("err", updated.getStderr());
}

TEST(ExecutionTypes, RequestLessonId)
{
    primer_common::ExecutionRequest request("basics", "hello_world", primer_common::BackendType::Remote);
    ASSERT_TRUE (request.isValid());
    ASSERT_EQ ("basics/hello_world", request.getLessonId());
    ASSERT_TRUE (request.getTimeout().isEmpty());

    primer_common::ExecutionRequest labRequest("", "scratch", primer_common::BackendType::Local,
        Option<absl::Duration>(absl::Seconds(1)));
    ASSERT_EQ ("scratch", labRequest.getLessonId());
    ASSERT_EQ (absl::Seconds(1), labRequest.getTimeout().getValue());
}

TEST(ExecutionTypes, ParseBackendType)
{
    tempo_config::ConfigMap map({
        {"backend", tempo_config::ConfigValue("Remote")},
    });

    primer_common::BackendTypeParser backendParser(primer_common::BackendType::Local);
    primer_common::BackendType backend;
    ASSERT_THAT (tempo_config::parse_config(backend, backendParser, map, "backend"), tempo_test::IsOk());
    ASSERT_EQ (primer_common::BackendType::Remote, backend);

    primer_common::BackendType defaultBackend;
    ASSERT_THAT (tempo_config::parse_config(defaultBackend, backendParser, map, "missing"), tempo_test::IsOk());
    ASSERT_EQ (primer_common::BackendType::Local, defaultBackend);
}

TEST(PrimerStatus, ConditionMapsToStatusCode)
{
    auto status = primer_common::PrimerStatus::forCondition(
        primer_common::PrimerCondition::kNotFound, "script {} not found", "/tmp/missing.py");
    ASSERT_TRUE (status.notOk());
    ASSERT_EQ (tempo_utils::StatusCode::kNotFound, status.getStatusCode());

    primer_common::PrimerStatus primerStatus;
    ASSERT_TRUE (status.convertTo(primerStatus));
    ASSERT_EQ (primer_common::PrimerCondition::kNotFound, primerStatus.getCondition());
    ASSERT_EQ ("script /tmp/missing.py not found", std::string(status.getMessage()));
}
