#include "coderun/core/language_registry.hpp"
#include "coderun/core/execution_errors.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

using namespace coderun::core;

namespace {

LanguageProfile RubyProfile() {
    return LanguageProfileBuilder("ruby")
        .WithImage("ruby:3.3")
        .WithSourceFile("main.rb")
        .WithRunCommand({"ruby", "main.rb"})
        .Build();
}

} // anonymous namespace

TEST(LanguageRegistryTest, BuiltinsCoverSupportedLanguages) {
    auto registry = LanguageRegistry::WithBuiltins();

    auto ids = registry.ListLanguages();
    for (const char* id : {"c", "cpp", "python", "python2", "javascript"}) {
        EXPECT_NE(std::find(ids.begin(), ids.end(), id), ids.end()) << id;
    }
    EXPECT_EQ(registry.Size(), 5u);
}

TEST(LanguageRegistryTest, ResolvesPython) {
    auto registry = LanguageRegistry::WithBuiltins();

    const auto& profile = registry.Resolve("python");
    EXPECT_EQ(profile.language_id, "python");
    EXPECT_EQ(profile.source_filename, "main.py");
    EXPECT_FALSE(profile.RequiresCompilation());
    EXPECT_EQ(profile.run_command, (std::vector<std::string>{"python3", "main.py"}));
    EXPECT_GT(profile.limits.time_limit.count(), 0);
}

TEST(LanguageRegistryTest, CompiledLanguagesCarryCompileCommand) {
    auto registry = LanguageRegistry::WithBuiltins();

    for (const char* id : {"c", "cpp"}) {
        const auto& profile = registry.Resolve(id);
        EXPECT_TRUE(profile.RequiresCompilation()) << id;
        EXPECT_EQ(profile.run_command, std::vector<std::string>{"./main"}) << id;
    }
}

TEST(LanguageRegistryTest, LookupIsExactAndCaseSensitive) {
    auto registry = LanguageRegistry::WithBuiltins();

    EXPECT_THROW(registry.Resolve("Python"), UnknownLanguageError);
    EXPECT_THROW(registry.Resolve("python "), UnknownLanguageError);
    EXPECT_THROW(registry.Resolve("py"), UnknownLanguageError);
    EXPECT_THROW(registry.Resolve(""), UnknownLanguageError);
    EXPECT_EQ(registry.Find("PYTHON"), nullptr);
    EXPECT_FALSE(registry.Contains("C"));
}

TEST(LanguageRegistryTest, UnknownLanguageErrorCarriesId) {
    LanguageRegistry registry;
    try {
        registry.Resolve("brainfuck");
        FAIL() << "expected UnknownLanguageError";
    }
    catch (const UnknownLanguageError& e) {
        EXPECT_EQ(e.LanguageId(), "brainfuck");
        EXPECT_EQ(e.Status(), ExecutionStatus::UNKNOWN_LANGUAGE);
        EXPECT_NE(std::string(e.what()).find("brainfuck"), std::string::npos);
    }
}

TEST(LanguageRegistryTest, RegisterAddsAndReplaces) {
    auto registry = LanguageRegistry::WithBuiltins();

    registry.Register(RubyProfile());
    EXPECT_TRUE(registry.Contains("ruby"));
    EXPECT_EQ(registry.Size(), 6u);

    auto replacement = LanguageProfileBuilder("python")
        .WithImage("python:3.11")
        .WithSourceFile("main.py")
        .WithRunCommand({"python3", "-u", "main.py"})
        .WithTimeLimit(std::chrono::seconds(2))
        .Build();
    registry.Register(replacement);

    EXPECT_EQ(registry.Size(), 6u);
    EXPECT_EQ(registry.Resolve("python").image_reference, "python:3.11");
    EXPECT_EQ(registry.Resolve("python").limits.time_limit, std::chrono::milliseconds(2000));
}

TEST(LanguageRegistryTest, InvalidProfilesAreRejected) {
    LanguageRegistry registry;

    auto no_image = RubyProfile();
    no_image.image_reference.clear();
    EXPECT_THROW(registry.Register(no_image), std::invalid_argument);

    auto nested_file = RubyProfile();
    nested_file.source_filename = "../main.rb";
    EXPECT_THROW(registry.Register(nested_file), std::invalid_argument);

    auto no_run = RubyProfile();
    no_run.run_command.clear();
    EXPECT_THROW(registry.Register(no_run), std::invalid_argument);

    auto zero_time = RubyProfile();
    zero_time.limits.time_limit = std::chrono::milliseconds(0);
    EXPECT_THROW(registry.Register(zero_time), std::invalid_argument);

    auto slow_compile = RubyProfile();
    slow_compile.compile_command = std::vector<std::string>{"ruby", "-c", "main.rb"};
    slow_compile.compile_time_limit = slow_compile.limits.time_limit;
    EXPECT_THROW(registry.Register(slow_compile), std::invalid_argument);

    auto zero_cpu = RubyProfile();
    zero_cpu.limits.cpu_limit = 0.0;
    EXPECT_THROW(registry.Register(zero_cpu), std::invalid_argument);

    EXPECT_EQ(registry.Size(), 0u);
}

TEST(LanguageRegistryTest, ValidateProfileExplainsProblem) {
    auto profile = RubyProfile();
    EXPECT_EQ(LanguageRegistry::ValidateProfile(profile), "");

    profile.limits.pids_limit = 0;
    EXPECT_NE(LanguageRegistry::ValidateProfile(profile).find("pids"), std::string::npos);
}

TEST(LanguageRegistryTest, EmptyCompileCommandMeansInterpreted) {
    auto profile = RubyProfile();
    profile.compile_command = std::vector<std::string>{};
    EXPECT_FALSE(profile.RequiresCompilation());
}
