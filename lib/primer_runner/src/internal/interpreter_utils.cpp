
#include <unistd.h>

#include <absl/strings/str_split.h>

#include <primer_common/primer_result.h>
#include <primer_runner/internal/interpreter_utils.h>
#include <tempo_utils/log_stream.h>

static bool
is_executable_file(const std::filesystem::path &path)
{
    return std::filesystem::is_regular_file(path) && access(path.c_str(), X_OK) == 0;
}

/**
 * Resolve the interpreter to an executable path. If the interpreter contains a directory
 * separator then it is used as is, otherwise each directory in PATH is searched in order.
 *
 * @param interpreter The interpreter name or path.
 * @return The path to the interpreter executable.
 */
tempo_utils::Result<std::filesystem::path>
primer_runner::internal::resolve_interpreter(std::string_view interpreter)
{
    if (interpreter.empty())
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kInvalidInput, "interpreter is empty");

    if (interpreter.find('/') != std::string_view::npos) {
        std::filesystem::path interpreterPath(interpreter);
        if (!is_executable_file(interpreterPath))
            return primer_common::PrimerStatus::forCondition(
                primer_common::PrimerCondition::kProcessFailure,
                "interpreter {} is not an executable file", interpreterPath.string());
        return interpreterPath;
    }

    const char *path = std::getenv("PATH");
    if (path != nullptr) {
        for (std::string_view directory : absl::StrSplit(path, ':', absl::SkipEmpty())) {
            auto candidate = std::filesystem::path(directory) / interpreter;
            if (is_executable_file(candidate)) {
                TU_LOG_VV << "resolved interpreter " << interpreter << " to " << candidate.string();
                return candidate;
            }
        }
    }

    return primer_common::PrimerStatus::forCondition(
        primer_common::PrimerCondition::kProcessFailure,
        "interpreter {} was not found in PATH", interpreter);
}
