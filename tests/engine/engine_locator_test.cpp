// =============================================================================
// pdf-shrink - Engine Locator Tests
// =============================================================================

#include "pds/engine/engine_locator.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "test_support.h"

namespace pds::engine {
namespace {

namespace fs = std::filesystem;

class EngineLocatorTest : public test::TempDirTest {
protected:
    void SetUp() override {
        test::TempDirTest::SetUp();
        if (const char* env = std::getenv(kEnginePathEnvVar)) {
            savedEnv_ = env;
        }
        ::unsetenv(kEnginePathEnvVar);
    }

    void TearDown() override {
        if (savedEnv_) {
            ::setenv(kEnginePathEnvVar, savedEnv_->c_str(), 1);
        } else {
            ::unsetenv(kEnginePathEnvVar);
        }
        test::TempDirTest::TearDown();
    }

    fs::path makeFile(const fs::path& relative, bool executable) {
        const fs::path path = scratch() / relative;
        fs::create_directories(path.parent_path());
        std::ofstream(path) << "#!/bin/sh\nexit 0\n";
        fs::permissions(path, executable ? fs::perms::owner_all
                                         : fs::perms::owner_read | fs::perms::owner_write);
        return path;
    }

    /// @brief Configuration that only probes the given paths.
    ServiceConfig configFor(std::vector<std::string> searchPaths) {
        ServiceConfig config;
        config.uploadRoot = uploadRoot();
        config.engineSearchPaths = std::move(searchPaths);
        config.honorEngineEnv = false;
        return config;
    }

private:
    std::optional<std::string> savedEnv_;
};

TEST_F(EngineLocatorTest, ExecutableCheck) {
    EXPECT_TRUE(isExecutableFile(makeFile("bin/gs", true)));
    EXPECT_FALSE(isExecutableFile(makeFile("bin/readonly", false)));
    EXPECT_FALSE(isExecutableFile(scratch() / "bin"));
    EXPECT_FALSE(isExecutableFile(scratch() / "missing"));
    EXPECT_FALSE(isExecutableFile(fs::path{}));
}

TEST_F(EngineLocatorTest, ExplicitPathWinsAndIsNeverReplaced) {
    const fs::path first = makeFile("a/gs", true);
    const fs::path second = makeFile("b/gs", true);

    ServiceConfig config = configFor({second.string()});
    config.enginePath = first;
    EXPECT_EQ(EngineLocator(config).locate().value().string(), first.string());

    // A broken explicit path is reported, not silently swapped for a search hit.
    config.enginePath = makeFile("c/gs", false);
    EXPECT_FALSE(EngineLocator(config).locate().has_value());
    ASSERT_EQ(EngineLocator(config).candidates().size(), 1u);
}

TEST_F(EngineLocatorTest, SearchPathsProbedInOrder) {
    const fs::path missing = scratch() / "nowhere/gs";
    const fs::path nonExec = makeFile("local/gs", false);
    const fs::path good = makeFile("usr/gs", true);
    const fs::path later = makeFile("opt/gs", true);

    EngineLocator locator(configFor({missing.string(), nonExec.string(), good.string(),
                                     later.string()}));
    EXPECT_EQ(locator.candidates().size(), 4u);
    EXPECT_EQ(locator.locate().value().string(), good.string());
}

TEST_F(EngineLocatorTest, NothingFound) {
    EngineLocator locator(configFor({(scratch() / "nowhere/gs").string()}));
    EXPECT_FALSE(locator.locate().has_value());
}

TEST_F(EngineLocatorTest, WildcardMatchesProbedInReverseLexicalOrder) {
    makeFile("Cellar/ghostscript/9.56.1/bin/gs", true);
    const fs::path newest = makeFile("Cellar/ghostscript/10.02.1/bin/gs", true);
    makeFile("Cellar/ghostscript/10.01.0/bin/gs", false);

    const std::string pattern = (scratch() / "Cellar/ghostscript/*/bin/gs").string();
    const auto expanded = expandSearchPattern(pattern);
    ASSERT_EQ(expanded.size(), 3u);
    EXPECT_EQ(expanded[0].string(),
              (scratch() / "Cellar/ghostscript/10.01.0/bin/gs").string());

    // Reverse lexical order: 9.56.1 sorts after 10.x as text.
    EngineLocator locator(configFor({pattern}));
    const auto candidates = locator.candidates();
    ASSERT_EQ(candidates.size(), 3u);
    EXPECT_EQ(candidates[0].string(),
              (scratch() / "Cellar/ghostscript/9.56.1/bin/gs").string());
    EXPECT_EQ(candidates[1].string(), newest.string());
}

TEST_F(EngineLocatorTest, WildcardWithoutMatchesExpandsToNothing) {
    EXPECT_TRUE(expandSearchPattern((scratch() / "none/*/gs").string()).empty());
    EXPECT_EQ(expandSearchPattern("/usr/bin/gs").size(), 1u);
}

TEST_F(EngineLocatorTest, EnvironmentVariableComesBeforeSearchPaths) {
    const fs::path fromEnv = makeFile("env/gs", true);
    const fs::path searched = makeFile("usr/gs", true);
    ::setenv(kEnginePathEnvVar, fromEnv.string().c_str(), 1);

    ServiceConfig config = configFor({searched.string()});
    EXPECT_EQ(EngineLocator(config).locate().value().string(), searched.string());

    config.honorEngineEnv = true;
    EXPECT_EQ(EngineLocator(config).locate().value().string(), fromEnv.string());

    ::setenv(kEnginePathEnvVar, "", 1);
    EXPECT_EQ(EngineLocator(config).candidates().size(), 1u);
}

}  // namespace
}  // namespace pds::engine
