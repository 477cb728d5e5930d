#ifndef PRIMER_RUNNER_LOCAL_RUNNER_H
#define PRIMER_RUNNER_LOCAL_RUNNER_H

#include "abstract_local_runner.h"

namespace primer_runner {

    constexpr const char *kDefaultInterpreter = "python3";

    struct RunnerOptions {
        std::string interpreter = kDefaultInterpreter;
        std::vector<std::string> interpreterArgs;
        std::filesystem::path workingDirectory;
    };

    /**
     * Runs lesson scripts as child processes of the caller. Each call to run() uses its own
     * event loop, so concurrent calls do not share any state.
     */
    class LocalRunner : public AbstractLocalRunner {
    public:
        explicit LocalRunner(const RunnerOptions &options = {});

        RunnerOptions getOptions() const;

        tempo_utils::Result<primer_common::ExecutionResult> run(
            const std::filesystem::path &scriptPath,
            absl::Duration timeout) override;

    private:
        RunnerOptions m_options;
    };
}

#endif // PRIMER_RUNNER_LOCAL_RUNNER_H
