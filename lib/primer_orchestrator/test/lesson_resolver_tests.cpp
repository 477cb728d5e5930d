#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <primer_common/primer_result.h>
#include <primer_orchestrator/lesson_resolver.h>
#include <tempo_test/tempo_test.h>
#include <tempo_utils/file_writer.h>
#include <tempo_utils/tempdir_maker.h>

class LessonResolver : public ::testing::Test {
protected:
    std::unique_ptr<tempo_utils::TempdirMaker> tempdir;
    std::filesystem::path lessonsRoot;
    std::filesystem::path labRoot;

    void SetUp() override {
        tempdir = std::make_unique<tempo_utils::TempdirMaker>(
            std::filesystem::current_path(), "tester.XXXXXXXX");
        TU_RAISE_IF_NOT_OK (tempdir->getStatus());
        lessonsRoot = tempdir->getTempdir() / "lessons";
        labRoot = tempdir->getTempdir() / "lab";
        std::filesystem::create_directories(lessonsRoot / "basics");
        std::filesystem::create_directories(lessonsRoot / "advanced");
        std::filesystem::create_directories(labRoot);

        writeFile(lessonsRoot / "basics" / "hello.py");
        writeFile(lessonsRoot / "basics" / "prompts.py");
        writeFile(lessonsRoot / "basics" / "_helpers.py");
        writeFile(lessonsRoot / "basics" / "notes.txt");
        writeFile(lessonsRoot / "advanced" / "agents.py");
        writeFile(labRoot / "scratch.py");
    }

    void writeFile(const std::filesystem::path &path) {
        tempo_utils::FileWriter writer(path, "pass\n", tempo_utils::FileWriterMode::CREATE_OR_OVERWRITE);
        TU_RAISE_IF_NOT_OK (writer.getStatus());
    }
};

static primer_common::PrimerCondition
condition_of(const tempo_utils::Status &status)
{
    primer_common::PrimerStatus primerStatus;
    if (!status.convertTo(primerStatus))
        return primer_common::PrimerCondition::kPrimerInvariant;
    return primerStatus.getCondition();
}

TEST_F(LessonResolver, ResolveLessonInCategory)
{
    primer_orchestrator::DirectoryLessonResolver resolver(lessonsRoot, labRoot);
    auto resolveResult = resolver.resolveLesson("basics", "hello");
    ASSERT_THAT (resolveResult, tempo_test::IsResult());
    ASSERT_EQ (lessonsRoot / "basics" / "hello.py", resolveResult.getResult());
}

TEST_F(LessonResolver, ResolveLessonWithExplicitExtension)
{
    primer_orchestrator::DirectoryLessonResolver resolver(lessonsRoot, labRoot);
    auto resolveResult = resolver.resolveLesson("advanced", "agents.py");
    ASSERT_THAT (resolveResult, tempo_test::IsResult());
    ASSERT_EQ (lessonsRoot / "advanced" / "agents.py", resolveResult.getResult());
}

TEST_F(LessonResolver, FallBackToLabDirectory)
{
    primer_orchestrator::DirectoryLessonResolver resolver(lessonsRoot, labRoot);
    auto resolveResult = resolver.resolveLesson("basics", "scratch");
    ASSERT_THAT (resolveResult, tempo_test::IsResult());
    ASSERT_EQ (labRoot / "scratch.py", resolveResult.getResult());

    auto uncategorizedResult = resolver.resolveLesson("", "scratch");
    ASSERT_THAT (uncategorizedResult, tempo_test::IsResult());
    ASSERT_EQ (labRoot / "scratch.py", uncategorizedResult.getResult());
}

TEST_F(LessonResolver, MissingLessonIsLessonNotFound)
{
    primer_orchestrator::DirectoryLessonResolver resolver(lessonsRoot);
    auto resolveResult = resolver.resolveLesson("basics", "scratch");
    ASSERT_TRUE (resolveResult.isStatus());
    ASSERT_EQ (primer_common::PrimerCondition::kLessonNotFound, condition_of(resolveResult.getStatus()));
}

TEST_F(LessonResolver, PathTraversalIsRejected)
{
    primer_orchestrator::DirectoryLessonResolver resolver(lessonsRoot, labRoot);

    auto parentResult = resolver.resolveLesson("..", "hello");
    ASSERT_TRUE (parentResult.isStatus());
    ASSERT_EQ (primer_common::PrimerCondition::kLessonNotFound, condition_of(parentResult.getStatus()));

    auto nestedResult = resolver.resolveLesson("basics", "../advanced/agents");
    ASSERT_TRUE (nestedResult.isStatus());

    auto emptyResult = resolver.resolveLesson("basics", "");
    ASSERT_TRUE (emptyResult.isStatus());
    ASSERT_EQ (primer_common::PrimerCondition::kLessonNotFound, condition_of(emptyResult.getStatus()));
}

TEST_F(LessonResolver, ListCategories)
{
    primer_orchestrator::DirectoryLessonResolver resolver(lessonsRoot, labRoot);
    auto listResult = resolver.listCategories();
    ASSERT_THAT (listResult, tempo_test::IsResult());
    ASSERT_THAT (listResult.getResult(), ::testing::ElementsAre("advanced", "basics"));
}

TEST_F(LessonResolver, ListLessonsSkipsHelpersAndOtherFiles)
{
    primer_orchestrator::DirectoryLessonResolver resolver(lessonsRoot, labRoot);
    auto listResult = resolver.listLessons("basics");
    ASSERT_THAT (listResult, tempo_test::IsResult());
    ASSERT_THAT (listResult.getResult(), ::testing::ElementsAre("hello", "prompts"));
}

TEST_F(LessonResolver, ListLessonsInMissingCategoryFails)
{
    primer_orchestrator::DirectoryLessonResolver resolver(lessonsRoot, labRoot);
    auto listResult = resolver.listLessons("missing");
    ASSERT_TRUE (listResult.isStatus());
    ASSERT_EQ (primer_common::PrimerCondition::kNotFound, condition_of(listResult.getStatus()));
}
