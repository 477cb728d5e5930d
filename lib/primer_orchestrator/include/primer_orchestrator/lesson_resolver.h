#ifndef PRIMER_ORCHESTRATOR_LESSON_RESOLVER_H
#define PRIMER_ORCHESTRATOR_LESSON_RESOLVER_H

#include <vector>

#include "abstract_lesson_resolver.h"

namespace primer_orchestrator {

    constexpr const char *kDefaultScriptExtension = ".py";

    /**
     * Resolves lessons laid out on disk as `<lessonsRoot>/<category>/<name><extension>`. Lessons
     * which are not found under the lessons root are looked up by name in the lab root, if one
     * is configured.
     */
    class DirectoryLessonResolver : public AbstractLessonResolver {
    public:
        DirectoryLessonResolver(
            const std::filesystem::path &lessonsRoot,
            const std::filesystem::path &labRoot = {},
            std::string_view scriptExtension = kDefaultScriptExtension);

        std::filesystem::path getLessonsRoot() const;
        std::filesystem::path getLabRoot() const;

        tempo_utils::Result<std::filesystem::path> resolveLesson(
            std::string_view category,
            std::string_view name) const override;

        tempo_utils::Result<std::vector<std::string>> listCategories() const override;
        tempo_utils::Result<std::vector<std::string>> listLessons(
            std::string_view category) const override;

    private:
        std::filesystem::path m_lessonsRoot;
        std::filesystem::path m_labRoot;
        std::string m_scriptExtension;

        std::string scriptFileName(std::string_view name) const;
    };
}

#endif // PRIMER_ORCHESTRATOR_LESSON_RESOLVER_H
