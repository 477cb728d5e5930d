#ifndef PRIMER_ORCHESTRATOR_TEST_MOCKS_H
#define PRIMER_ORCHESTRATOR_TEST_MOCKS_H

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <primer_orchestrator/abstract_lesson_resolver.h>
#include <primer_runner/abstract_local_runner.h>
#include <primer_sandbox/abstract_sandbox_client.h>

class MockLessonResolver : public primer_orchestrator::AbstractLessonResolver {
public:
    MOCK_METHOD (
        tempo_utils::Result<std::filesystem::path>,
        resolveLesson,
        (std::string_view category, std::string_view name),
        (const, override));

    MOCK_METHOD (
        tempo_utils::Result<std::vector<std::string>>,
        listCategories,
        (),
        (const, override));

    MOCK_METHOD (
        tempo_utils::Result<std::vector<std::string>>,
        listLessons,
        (std::string_view category),
        (const, override));
};

class MockLocalRunner : public primer_runner::AbstractLocalRunner {
public:
    MOCK_METHOD (
        tempo_utils::Result<primer_common::ExecutionResult>,
        run,
        (const std::filesystem::path &scriptPath, absl::Duration timeout),
        (override));
};

class MockSandboxClient : public primer_sandbox::AbstractSandboxClient {
public:
    MOCK_METHOD (
        tempo_utils::Result<primer_sandbox::SubmissionHandle>,
        submit,
        (std::string_view sourceCode, int languageId),
        (override));

    MOCK_METHOD (
        tempo_utils::Result<primer_sandbox::PollResult>,
        poll,
        (primer_sandbox::SubmissionHandle &handle, absl::Duration timeout),
        (override));

    MOCK_METHOD (
        bool,
        healthCheck,
        (),
        (override));
};

#endif // PRIMER_ORCHESTRATOR_TEST_MOCKS_H
