// =============================================================================
// pdf-shrink - Assembler Property Tests
// =============================================================================
// Property-based tests for chunk reassembly.
//
// For any payload split into chunks and uploaded in any order (with any
// number of re-uploads), assembly reproduces the payload byte for byte.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "pds/pipeline/assembler.h"
#include "pds/session/chunk_store.h"
#include "test_support.h"

namespace pds::pipeline::test {

using pds::test::makeBytes;

// =============================================================================
// Test Fixtures
// =============================================================================

class AssemblerTest : public pds::test::TempDirTest {};

// =============================================================================
// Unit Tests
// =============================================================================

TEST_F(AssemblerTest, TwelveChunksAssembleInNumericOrder) {
    session::ChunkStore store(uploadRoot());

    // Marker byte per chunk; lexical ordering would put 10 and 11 after 1.
    std::vector<std::uint8_t> expected;
    for (ChunkIndex index : {11u, 10u, 2u, 1u, 0u, 3u, 4u, 5u, 6u, 7u, 8u, 9u}) {
        (void)store.storeChunk("twelve.pdf", index, 12,
                               Bytes{static_cast<std::uint8_t>(index)});
    }
    for (std::uint8_t i = 0; i < 12; ++i) {
        expected.push_back(i);
    }

    AssembledFile file = Assembler(store).assemble("twelve.pdf");
    EXPECT_EQ(file.chunkCount, 12u);
    EXPECT_EQ(file.bytes, expected);
}

TEST_F(AssemblerTest, ConcatenatesWithoutSeparators) {
    session::ChunkStore store(uploadRoot());
    (void)store.storeChunk("a.pdf", 0, 3, makeBytes(100 * 1024, 1));
    (void)store.storeChunk("a.pdf", 1, 3, makeBytes(100 * 1024, 2));
    (void)store.storeChunk("a.pdf", 2, 3, makeBytes(50 * 1024, 3));

    AssembledFile file = Assembler(store).assemble("a.pdf");
    ASSERT_EQ(file.size(), 250u * 1024);

    Bytes expected = makeBytes(100 * 1024, 1);
    const Bytes second = makeBytes(100 * 1024, 2);
    const Bytes third = makeBytes(50 * 1024, 3);
    expected.insert(expected.end(), second.begin(), second.end());
    expected.insert(expected.end(), third.begin(), third.end());
    EXPECT_EQ(file.bytes, expected);
}

TEST_F(AssemblerTest, GapRaisesIncompleteWithMissingIndices) {
    session::ChunkStore store(uploadRoot());
    (void)store.storeChunk("gap.pdf", 0, 3, makeBytes(10));
    (void)store.storeChunk("gap.pdf", 2, 3, makeBytes(10));

    try {
        (void)Assembler(store).assemble("gap.pdf");
        FAIL() << "expected IncompleteUploadError";
    } catch (const IncompleteUploadError& e) {
        ASSERT_EQ(e.missing().size(), 1u);
        EXPECT_EQ(e.missing()[0], 1u);
    }
}

TEST_F(AssemblerTest, UnknownSessionIsIncomplete) {
    session::ChunkStore store(uploadRoot());
    EXPECT_THROW((void)Assembler(store).assemble("nothing.pdf"), IncompleteUploadError);
}

TEST_F(AssemblerTest, ChunkDeletedOutsideTheStoreIsDetected) {
    session::ChunkStore store(uploadRoot());
    (void)store.storeChunk("a.pdf", 0, 2, makeBytes(10));
    (void)store.storeChunk("a.pdf", 1, 2, makeBytes(10));
    std::filesystem::remove(store.sessionDirectory(session::makeSessionId("a.pdf")) /
                            session::chunkFileName(1));

    EXPECT_THROW((void)Assembler(store).assemble("a.pdf"), IncompleteUploadError);
}

// =============================================================================
// Property Tests
// =============================================================================

class AssemblerPropertyTest : public pds::test::TempDirTest {};

RC_GTEST_FIXTURE_PROP(AssemblerPropertyTest, AnyUploadOrderReassemblesPayload, ()) {
    const auto payload = *rc::gen::nonEmpty(rc::gen::container<std::vector<std::uint8_t>>(
        rc::gen::arbitrary<std::uint8_t>()));
    const auto chunkSize = *rc::gen::inRange<std::size_t>(1, payload.size() + 1);
    const auto totalChunks =
        static_cast<std::uint32_t>((payload.size() + chunkSize - 1) / chunkSize);

    std::vector<ChunkIndex> order(totalChunks);
    for (ChunkIndex i = 0; i < totalChunks; ++i) {
        order[i] = i;
    }
    order = *rc::gen::shuffle(order);

    // Some indices are uploaded twice with the same content.
    const auto repeats = *rc::gen::container<std::vector<ChunkIndex>>(
        rc::gen::inRange<ChunkIndex>(0, totalChunks));
    order.insert(order.end(), repeats.begin(), repeats.end());

    const std::string fileName = "property.pdf";
    session::ChunkStore store(uploadRoot());

    for (ChunkIndex index : order) {
        const std::size_t offset = static_cast<std::size_t>(index) * chunkSize;
        const std::size_t length = std::min(chunkSize, payload.size() - offset);
        std::span<const std::uint8_t> chunk(payload.data() + offset, length);
        (void)store.storeChunk(fileName, index, totalChunks, chunk);
    }

    RC_ASSERT(store.isComplete(fileName, totalChunks));

    AssembledFile file = Assembler(store).assemble(fileName);
    RC_ASSERT(file.chunkCount == totalChunks);
    RC_ASSERT(file.bytes == payload);
}

}  // namespace pds::pipeline::test
