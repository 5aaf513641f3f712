// =============================================================================
// pdf-shrink - Ghostscript Engine Tests
// =============================================================================
// Drives GhostscriptEngine against small shell scripts standing in for the
// real binary, one per failure mode.
// =============================================================================

#include "pds/engine/ghostscript_engine.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "pds/engine/subprocess.h"
#include "test_support.h"

namespace pds::engine {
namespace {

namespace fs = std::filesystem;
using test::makePdfBytes;

/// @brief Shell prologue that extracts the -sOutputFile= argument into $out.
constexpr const char* kParseOutput =
    "#!/bin/sh\n"
    "out=\n"
    "for arg in \"$@\"; do\n"
    "  case \"$arg\" in\n"
    "    -sOutputFile=*) out=\"${arg#-sOutputFile=}\" ;;\n"
    "  esac\n"
    "done\n";

class GhostscriptEngineTest : public test::TempDirTest {
protected:
    fs::path writeScript(const std::string& name, const std::string& body) {
        const fs::path path = scratch() / name;
        std::ofstream(path) << kParseOutput << body;
        fs::permissions(path, fs::perms::owner_all | fs::perms::group_read |
                                  fs::perms::group_exec | fs::perms::others_read |
                                  fs::perms::others_exec);
        return path;
    }

    GhostscriptEngine makeEngine(const fs::path& executable) {
        GhostscriptOptions options;
        options.executable = executable;
        options.scratchRoot = scratch() / "engine";
        return GhostscriptEngine(std::move(options));
    }

    [[nodiscard]] bool scratchRootIsEmpty() const {
        const fs::path root = scratch() / "engine";
        return !fs::exists(root) || fs::is_empty(root);
    }

    CompressionProfile profile_{CompressionLevel::kEbook, 150};
};

// =============================================================================
// Signature
// =============================================================================

TEST(PdfSignatureTest, RecognizesHeader) {
    EXPECT_TRUE(hasPdfSignature(makePdfBytes(32)));

    const Bytes exact = {'%', 'P', 'D', 'F'};
    EXPECT_TRUE(hasPdfSignature(exact));

    const Bytes shortBuffer = {'%', 'P', 'D'};
    EXPECT_FALSE(hasPdfSignature(shortBuffer));

    const Bytes html = {'<', 'h', 't', 'm', 'l', '>'};
    EXPECT_FALSE(hasPdfSignature(html));
    EXPECT_FALSE(hasPdfSignature(Bytes{}));
}

// =============================================================================
// Arguments
// =============================================================================

TEST(GhostscriptArgumentsTest, ReflectsProfileAndPaths) {
    GhostscriptOptions options;
    options.executable = "/usr/bin/gs";
    options.compatibilityLevel = "1.5";
    GhostscriptEngine engine(options);

    const auto args = engine.buildArguments({CompressionLevel::kEbook, 150}, "/tmp/in.pdf",
                                            "/tmp/out.pdf");
    auto has = [&args](const std::string& value) {
        return std::find(args.begin(), args.end(), value) != args.end();
    };

    ASSERT_FALSE(args.empty());
    EXPECT_EQ(args.front(), "-dSAFER");
    EXPECT_EQ(args.back(), "/tmp/in.pdf");
    EXPECT_TRUE(has("-sDEVICE=pdfwrite"));
    EXPECT_TRUE(has("-dCompatibilityLevel=1.5"));
    EXPECT_TRUE(has("-dPDFSETTINGS=/ebook"));
    EXPECT_TRUE(has("-dBATCH"));
    EXPECT_TRUE(has("-dNOPAUSE"));
    EXPECT_TRUE(has("-r150"));
    EXPECT_TRUE(has("-dColorImageResolution=150"));
    EXPECT_TRUE(has("-dGrayImageResolution=150"));
    EXPECT_TRUE(has("-dMonoImageResolution=150"));
    EXPECT_TRUE(has("-dColorImageFilter=/DCTEncode"));
    EXPECT_TRUE(has("-sOutputFile=/tmp/out.pdf"));
}

TEST(GhostscriptArgumentsTest, DefaultLevelMapsToDefaultSettings) {
    GhostscriptEngine engine(GhostscriptOptions{});
    const auto args =
        engine.buildArguments({CompressionLevel::kDefault, 72}, "in.pdf", "out.pdf");
    EXPECT_NE(std::find(args.begin(), args.end(), "-dPDFSETTINGS=/default"), args.end());
    EXPECT_NE(std::find(args.begin(), args.end(), "-dCompatibilityLevel=1.4"), args.end());
    EXPECT_NE(std::find(args.begin(), args.end(), "-r72"), args.end());
}

// =============================================================================
// Invocation
// =============================================================================

TEST_F(GhostscriptEngineTest, ReturnsEngineOutput) {
    const fs::path gs = writeScript("gs-ok", "printf '%%PDF-1.4 small' > \"$out\"\n");
    auto engine = makeEngine(gs);
    EXPECT_TRUE(engine.available());

    const Bytes result = engine.compress(makePdfBytes(4096), profile_);
    const std::string text(result.begin(), result.end());
    EXPECT_EQ(text, "%PDF-1.4 small");
    EXPECT_TRUE(scratchRootIsEmpty());
}

TEST_F(GhostscriptEngineTest, EngineSeesTheInputDocument) {
    // Echo the input (last argument) back as the output.
    const fs::path gs =
        writeScript("gs-copy", "for last in \"$@\"; do :; done\ncp \"$last\" \"$out\"\n");
    auto engine = makeEngine(gs);

    const Bytes input = makePdfBytes(10000, 7);
    EXPECT_EQ(engine.compress(input, profile_), input);
}

TEST_F(GhostscriptEngineTest, NonZeroExitCarriesDiagnostics) {
    const fs::path gs =
        writeScript("gs-fail", "echo 'Error: /syntaxerror in --token--' >&2\nexit 3\n");
    auto engine = makeEngine(gs);

    try {
        (void)engine.compress(makePdfBytes(100), profile_);
        FAIL() << "expected CompressionEngineFailure";
    } catch (const CompressionEngineFailure& e) {
        EXPECT_EQ(e.exitStatus(), 3);
        EXPECT_NE(e.diagnostics().find("/syntaxerror"), std::string::npos);
        EXPECT_EQ(e.code(), ErrorCode::kEngineFailure);
    }
    EXPECT_TRUE(scratchRootIsEmpty());
}

TEST_F(GhostscriptEngineTest, KilledBySignalIsAFailure) {
    const fs::path gs = writeScript("gs-killed", "kill -9 $$\n");
    auto engine = makeEngine(gs);

    try {
        (void)engine.compress(makePdfBytes(100), profile_);
        FAIL() << "expected CompressionEngineFailure";
    } catch (const CompressionEngineFailure& e) {
        EXPECT_EQ(e.exitStatus(), 128 + 9);
    }
}

TEST_F(GhostscriptEngineTest, MissingOutputIsEmptyResult) {
    const fs::path gs = writeScript("gs-none", "exit 0\n");
    auto engine = makeEngine(gs);
    EXPECT_THROW((void)engine.compress(makePdfBytes(100), profile_), EmptyResultFailure);
}

TEST_F(GhostscriptEngineTest, ZeroByteOutputIsEmptyResult) {
    const fs::path gs = writeScript("gs-empty", ": > \"$out\"\n");
    auto engine = makeEngine(gs);
    EXPECT_THROW((void)engine.compress(makePdfBytes(100), profile_), EmptyResultFailure);
    EXPECT_TRUE(scratchRootIsEmpty());
}

TEST_F(GhostscriptEngineTest, NonPdfOutputIsInvalid) {
    const fs::path gs = writeScript("gs-garbage", "printf 'GIF89a' > \"$out\"\n");
    auto engine = makeEngine(gs);
    EXPECT_THROW((void)engine.compress(makePdfBytes(100), profile_), InvalidOutputFailure);
}

TEST_F(GhostscriptEngineTest, NoExecutableIsUnavailable) {
    GhostscriptOptions options;
    options.scratchRoot = scratch() / "engine";
    GhostscriptEngine engine(options);

    EXPECT_FALSE(engine.available());
    EXPECT_THROW((void)engine.compress(makePdfBytes(100), profile_), EngineUnavailableError);
}

TEST_F(GhostscriptEngineTest, VanishedExecutableIsUnavailable) {
    auto engine = makeEngine(scratch() / "deleted-gs");
    EXPECT_THROW((void)engine.compress(makePdfBytes(100), profile_), EngineUnavailableError);
    EXPECT_TRUE(scratchRootIsEmpty());
}

TEST_F(GhostscriptEngineTest, RejectsInvalidProfile) {
    const fs::path gs = writeScript("gs-ok", "printf '%%PDF-1.4' > \"$out\"\n");
    auto engine = makeEngine(gs);
    EXPECT_THROW((void)engine.compress(makePdfBytes(100), {CompressionLevel::kScreen, 600}),
                 InvalidProfileError);
}

TEST_F(GhostscriptEngineTest, FactoryUsesConfiguredBinary) {
    const fs::path gs = writeScript("gs-ok", "printf '%%PDF-1.4' > \"$out\"\n");

    ServiceConfig config;
    config.uploadRoot = uploadRoot();
    config.enginePath = gs;

    auto engine = makeGhostscriptEngine(config);
    ASSERT_NE(engine, nullptr);
    EXPECT_TRUE(engine->available());
    EXPECT_EQ(engine->name(), "ghostscript");
    EXPECT_FALSE(engine->compress(makePdfBytes(100), profile_).empty());

    config.enginePath = scratch() / "missing-gs";
    EXPECT_FALSE(makeGhostscriptEngine(config)->available());
}

// =============================================================================
// Subprocess
// =============================================================================

TEST_F(GhostscriptEngineTest, RunProcessCapturesBothStreams) {
    const fs::path script = writeScript("both", "echo out\necho err >&2\nexit 5\n");
    const ProcessResult run = runProcess(script, {"a", "b"}, scratch() / "capture.log");

    EXPECT_FALSE(run.succeeded());
    EXPECT_FALSE(run.signaled);
    EXPECT_EQ(run.exitStatus, 5);
    EXPECT_NE(run.output.find("out"), std::string::npos);
    EXPECT_NE(run.output.find("err"), std::string::npos);
}

TEST_F(GhostscriptEngineTest, RunProcessReportsSpawnFailure) {
    EXPECT_THROW((void)runProcess(scratch() / "no-such-program", {}, scratch() / "capture.log"),
                 std::system_error);
}

}  // namespace
}  // namespace pds::engine
