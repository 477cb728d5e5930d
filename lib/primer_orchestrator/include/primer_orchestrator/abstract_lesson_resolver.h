#ifndef PRIMER_ORCHESTRATOR_ABSTRACT_LESSON_RESOLVER_H
#define PRIMER_ORCHESTRATOR_ABSTRACT_LESSON_RESOLVER_H

#include <filesystem>
#include <string>
#include <vector>

#include <tempo_utils/result.h>

namespace primer_orchestrator {

    class AbstractLessonResolver {
    public:
        virtual ~AbstractLessonResolver() = default;

        /**
         * Resolve a lesson to the path of its script.
         *
         * @param category The lesson category.
         * @param name The lesson name.
         * @return The script path, or LessonNotFound status if the lesson does not exist.
         */
        virtual tempo_utils::Result<std::filesystem::path> resolveLesson(
            std::string_view category,
            std::string_view name) const = 0;

        /**
         * List the lesson categories.
         *
         * @return The sorted category names.
         */
        virtual tempo_utils::Result<std::vector<std::string>> listCategories() const = 0;

        /**
         * List the lessons available in the specified category.
         *
         * @param category The lesson category.
         * @return The sorted lesson names.
         */
        virtual tempo_utils::Result<std::vector<std::string>> listLessons(
            std::string_view category) const = 0;
    };
}

#endif // PRIMER_ORCHESTRATOR_ABSTRACT_LESSON_RESOLVER_H
