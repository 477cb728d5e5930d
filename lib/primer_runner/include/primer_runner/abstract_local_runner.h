#ifndef PRIMER_RUNNER_ABSTRACT_LOCAL_RUNNER_H
#define PRIMER_RUNNER_ABSTRACT_LOCAL_RUNNER_H

#include <filesystem>

#include <absl/time/time.h>

#include <primer_common/execution_types.h>
#include <tempo_utils/result.h>

namespace primer_runner {

    class AbstractLocalRunner {
    public:
        virtual ~AbstractLocalRunner() = default;

        /**
         * Run the script at the specified path as a child process, waiting at most `timeout`
         * for it to exit.
         *
         * @param scriptPath Path to the script.
         * @param timeout The maximum time the script may run before it is killed.
         * @return The execution result, or NotFound status if the script does not exist.
         */
        virtual tempo_utils::Result<primer_common::ExecutionResult> run(
            const std::filesystem::path &scriptPath,
            absl::Duration timeout) = 0;
    };
}

#endif // PRIMER_RUNNER_ABSTRACT_LOCAL_RUNNER_H
