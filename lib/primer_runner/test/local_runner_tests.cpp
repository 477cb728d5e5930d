#include <gtest/gtest.h>

#include <thread>

#include <absl/strings/match.h>
#include <absl/time/clock.h>

#include <primer_common/primer_result.h>
#include <primer_runner/local_runner.h>
#include <tempo_test/tempo_test.h>
#include <tempo_utils/file_writer.h>
#include <tempo_utils/log_stream.h>
#include <tempo_utils/tempdir_maker.h>

class LocalRunner : public ::testing::Test {
protected:
    std::unique_ptr<tempo_utils::TempdirMaker> tempdir;
    primer_runner::RunnerOptions options;

    void SetUp() override {
        tempo_utils::init_logging(tempo_utils::LoggingConfiguration{});
        tempdir = std::make_unique<tempo_utils::TempdirMaker>(
            std::filesystem::current_path(), "tester.XXXXXXXX");
        TU_RAISE_IF_NOT_OK (tempdir->getStatus());
        options.interpreter = "/bin/sh";
    }

    std::filesystem::path writeScript(std::string_view name, std::string_view content) {
        auto scriptPath = tempdir->getTempdir() / name;
        tempo_utils::FileWriter writer(scriptPath, content, tempo_utils::FileWriterMode::CREATE_OR_OVERWRITE);
        TU_RAISE_IF_NOT_OK (writer.getStatus());
        return scriptPath;
    }
};

TEST_F(LocalRunner, RunScriptSucceeds)
{
    auto scriptPath = writeScript("hello.sh", "echo hello\necho oops 1>&2\n");

    primer_runner::LocalRunner runner(options);
    auto runResult = runner.run(scriptPath, absl::Seconds(10));
    ASSERT_THAT (runResult, tempo_test::IsResult());
    auto result = runResult.getResult();

    ASSERT_EQ (primer_common::ExecutionStatus::Succeeded, result.getStatus());
    ASSERT_EQ (0, result.getExitCode().getValue());
    ASSERT_EQ ("hello\n", result.getStdout());
    ASSERT_EQ ("oops\n", result.getStderr());
    ASSERT_EQ (primer_common::BackendType::Local, result.getBackendUsed());
}

TEST_F(LocalRunner, InterpreterArgsPrecedeScriptPath)
{
    auto scriptPath = writeScript("trace.sh", "echo hello\n");
    options.interpreterArgs = {"-x"};

    primer_runner::LocalRunner runner(options);
    auto runResult = runner.run(scriptPath, absl::Seconds(10));
    ASSERT_THAT (runResult, tempo_test::IsResult());
    auto result = runResult.getResult();

    ASSERT_EQ (primer_common::ExecutionStatus::Succeeded, result.getStatus());
    ASSERT_EQ ("hello\n", result.getStdout());
    ASSERT_TRUE (absl::StrContains(result.getStderr(), "+ echo hello"));
}

TEST_F(LocalRunner, NonzeroExitIsFailed)
{
    auto scriptPath = writeScript("fail.sh", "echo partial\nexit 3\n");

    primer_runner::LocalRunner runner(options);
    auto runResult = runner.run(scriptPath, absl::Seconds(10));
    ASSERT_THAT (runResult, tempo_test::IsResult());
    auto result = runResult.getResult();

    ASSERT_EQ (primer_common::ExecutionStatus::Failed, result.getStatus());
    ASSERT_EQ (3, result.getExitCode().getValue());
    ASSERT_EQ ("partial\n", result.getStdout());
}

TEST_F(LocalRunner, KilledBySignalIsFailedWithoutExitCode)
{
    auto scriptPath = writeScript("signal.sh", "kill -9 $$\n");

    primer_runner::LocalRunner runner(options);
    auto runResult = runner.run(scriptPath, absl::Seconds(10));
    ASSERT_THAT (runResult, tempo_test::IsResult());
    auto result = runResult.getResult();

    ASSERT_EQ (primer_common::ExecutionStatus::Failed, result.getStatus());
    ASSERT_TRUE (result.getExitCode().isEmpty());
}

TEST_F(LocalRunner, MissingScriptIsNotFound)
{
    primer_runner::LocalRunner runner(options);
    auto runResult = runner.run(tempdir->getTempdir() / "missing.sh", absl::Seconds(10));
    ASSERT_TRUE (runResult.isStatus());

    primer_common::PrimerStatus status;
    ASSERT_TRUE (runResult.getStatus().convertTo(status));
    ASSERT_EQ (primer_common::PrimerCondition::kNotFound, status.getCondition());
}

TEST_F(LocalRunner, MissingInterpreterIsError)
{
    auto scriptPath = writeScript("hello.sh", "echo hello\n");

    options.interpreter = (tempdir->getTempdir() / "no-such-interpreter").string();
    primer_runner::LocalRunner runner(options);
    auto runResult = runner.run(scriptPath, absl::Seconds(10));
    ASSERT_TRUE (runResult.isStatus());
}

TEST_F(LocalRunner, ScriptExceedingTimeoutIsKilled)
{
    auto markerPath = tempdir->getTempdir() / "marker";
    auto scriptPath = writeScript("sleepy.sh", "echo started\nsleep 1\necho finished > marker\n");

    primer_runner::LocalRunner runner(options);
    auto startTime = absl::Now();
    auto runResult = runner.run(scriptPath, absl::Milliseconds(200));
    auto elapsed = absl::Now() - startTime;
    ASSERT_THAT (runResult, tempo_test::IsResult());
    auto result = runResult.getResult();

    ASSERT_EQ (primer_common::ExecutionStatus::TimedOut, result.getStatus());
    ASSERT_TRUE (result.getExitCode().isEmpty());
    ASSERT_LT (elapsed, absl::Milliseconds(900));

    // if any process in the group survived then the marker would appear after the sleep
    absl::SleepFor(absl::Milliseconds(1500));
    ASSERT_FALSE (std::filesystem::exists(markerPath));
}

TEST_F(LocalRunner, WorkingDirectoryDefaultsToScriptDirectory)
{
    auto scriptPath = writeScript("pwd.sh", "pwd -P\n");

    primer_runner::LocalRunner runner(options);
    auto runResult = runner.run(scriptPath, absl::Seconds(10));
    ASSERT_THAT (runResult, tempo_test::IsResult());
    auto result = runResult.getResult();

    auto expected = std::filesystem::canonical(tempdir->getTempdir()).string() + "\n";
    ASSERT_EQ (expected, result.getStdout());
}

TEST_F(LocalRunner, ConcurrentRunsAreIndependent)
{
    auto firstPath = writeScript("first.sh", "echo first\n");
    auto secondPath = writeScript("second.sh", "echo second 1>&2\nexit 2\n");

    primer_runner::LocalRunner runner(options);
    primer_common::ExecutionResult firstResult;
    primer_common::ExecutionResult secondResult;

    std::thread firstThread([&]{
        auto runResult = runner.run(firstPath, absl::Seconds(10));
        if (runResult.isResult()) {
            firstResult = runResult.getResult();
        }
    });
    std::thread secondThread([&]{
        auto runResult = runner.run(secondPath, absl::Seconds(10));
        if (runResult.isResult()) {
            secondResult = runResult.getResult();
        }
    });
    firstThread.join();
    secondThread.join();

    ASSERT_EQ (primer_common::ExecutionStatus::Succeeded, firstResult.getStatus());
    ASSERT_EQ ("first\n", firstResult.getStdout());

    ASSERT_EQ (primer_common::ExecutionStatus::Failed, secondResult.getStatus());
    ASSERT_EQ ("second\n", secondResult.getStderr());
}
