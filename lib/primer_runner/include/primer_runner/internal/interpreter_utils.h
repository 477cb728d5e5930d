#ifndef PRIMER_RUNNER_INTERNAL_INTERPRETER_UTILS_H
#define PRIMER_RUNNER_INTERNAL_INTERPRETER_UTILS_H

#include <filesystem>

#include <tempo_utils/result.h>

namespace primer_runner::internal {

    tempo_utils::Result<std::filesystem::path> resolve_interpreter(std::string_view interpreter);
}

#endif // PRIMER_RUNNER_INTERNAL_INTERPRETER_UTILS_H
