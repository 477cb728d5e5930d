
#include <algorithm>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

#include <primer_common/primer_result.h>
#include <primer_orchestrator/lesson_resolver.h>
#include <tempo_utils/log_stream.h>

primer_orchestrator::DirectoryLessonResolver::DirectoryLessonResolver(
    const std::filesystem::path &lessonsRoot,
    const std::filesystem::path &labRoot,
    std::string_view scriptExtension)
    : m_lessonsRoot(lessonsRoot),
      m_labRoot(labRoot),
      m_scriptExtension(scriptExtension)
{
    TU_ASSERT (!m_lessonsRoot.empty());
}

std::filesystem::path
primer_orchestrator::DirectoryLessonResolver::getLessonsRoot() const
{
    return m_lessonsRoot;
}

std::filesystem::path
primer_orchestrator::DirectoryLessonResolver::getLabRoot() const
{
    return m_labRoot;
}

std::string
primer_orchestrator::DirectoryLessonResolver::scriptFileName(std::string_view name) const
{
    if (m_scriptExtension.empty() || absl::EndsWith(name, m_scriptExtension))
        return std::string(name);
    return absl::StrCat(name, m_scriptExtension);
}

// names must be a single path component so a lesson cannot escape the lessons root
static bool
is_valid_component(std::string_view component)
{
    if (component.empty() || component == "." || component == "..")
        return false;
    return component.find('/') == std::string_view::npos;
}

tempo_utils::Result<std::filesystem::path>
primer_orchestrator::DirectoryLessonResolver::resolveLesson(
    std::string_view category,
    std::string_view name) const
{
    if (!is_valid_component(name) || (!category.empty() && !is_valid_component(category)))
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kLessonNotFound,
            "invalid lesson '{}' in category '{}'", name, category);

    auto fileName = scriptFileName(name);

    if (!category.empty()) {
        auto lessonPath = m_lessonsRoot / category / fileName;
        if (std::filesystem::is_regular_file(lessonPath))
            return lessonPath;
    }

    // fall back to the lab directory
    if (!m_labRoot.empty()) {
        auto labPath = m_labRoot / fileName;
        if (std::filesystem::is_regular_file(labPath)) {
            TU_LOG_V << "resolved lesson " << name << " from lab directory";
            return labPath;
        }
    }

    return primer_common::PrimerStatus::forCondition(
        primer_common::PrimerCondition::kLessonNotFound,
        "lesson '{}' not found in category '{}'", name, category);
}

/**
 * List the lesson categories, which are the subdirectories of the lessons root.
 *
 * @return The sorted category names.
 */
tempo_utils::Result<std::vector<std::string>>
primer_orchestrator::DirectoryLessonResolver::listCategories() const
{
    std::error_code ec;
    std::filesystem::directory_iterator it(m_lessonsRoot, ec);
    if (ec)
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kNotFound,
            "failed to read lessons root {}: {}", m_lessonsRoot.string(), ec.message());

    std::vector<std::string> categories;
    for (const auto &entry : it) {
        if (entry.is_directory()) {
            categories.push_back(entry.path().filename().string());
        }
    }
    std::sort(categories.begin(), categories.end());
    return categories;
}

/**
 * List the lessons in the specified category. Files whose names begin with an underscore are
 * not lessons and are skipped.
 *
 * @param category The lesson category.
 * @return The sorted lesson names, without the script extension.
 */
tempo_utils::Result<std::vector<std::string>>
primer_orchestrator::DirectoryLessonResolver::listLessons(std::string_view category) const
{
    if (!is_valid_component(category))
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kInvalidInput, "invalid category '{}'", category);

    auto categoryPath = m_lessonsRoot / category;
    std::error_code ec;
    std::filesystem::directory_iterator it(categoryPath, ec);
    if (ec)
        return primer_common::PrimerStatus::forCondition(
            primer_common::PrimerCondition::kNotFound,
            "failed to read category {}: {}", categoryPath.string(), ec.message());

    std::vector<std::string> lessons;
    for (const auto &entry : it) {
        if (!entry.is_regular_file())
            continue;
        auto fileName = entry.path().filename().string();
        if (absl::StartsWith(fileName, "_"))
            continue;
        if (!m_scriptExtension.empty()) {
            if (!absl::EndsWith(fileName, m_scriptExtension))
                continue;
            fileName.resize(fileName.size() - m_scriptExtension.size());
        }
        lessons.push_back(fileName);
    }
    std::sort(lessons.begin(), lessons.end());
    return lessons;
}
