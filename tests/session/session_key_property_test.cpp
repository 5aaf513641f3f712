// =============================================================================
// pdf-shrink - Session Key Property Tests
// =============================================================================
// Untrusted file names map onto fixed-shape directory names and safe display
// names, whatever bytes they contain.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <string>

#include "pds/common/error.h"
#include "pds/session/session_key.h"

namespace pds::session::test {

namespace {

bool isSafeDisplayChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '.' || c == '_' || c == '-' || c == ' ';
}

}  // namespace

// =============================================================================
// Unit Tests
// =============================================================================

TEST(SessionKeyTest, SameNameSameId) {
    EXPECT_EQ(makeSessionId("report.pdf"), makeSessionId("report.pdf"));
    EXPECT_NE(makeSessionId("report.pdf"), makeSessionId("report2.pdf"));
}

TEST(SessionKeyTest, IdHasFixedShape) {
    const SessionId id = makeSessionId("report.pdf");
    EXPECT_EQ(id.size(), kSessionIdLength);
    EXPECT_TRUE(looksLikeSessionId(id));
}

TEST(SessionKeyTest, TraversalNamesStayInsideRoot) {
    const SessionKey key = SessionKey::fromFileName("../../etc/passwd");
    EXPECT_TRUE(looksLikeSessionId(key.id));
    EXPECT_EQ(key.displayName, "passwd");
    EXPECT_EQ(key.suggestedFileName(), "compressed_passwd");
}

TEST(SessionKeyTest, DisplayNameKeepsOrdinaryNames) {
    EXPECT_EQ(sanitizeDisplayName("Annual Report 2024.pdf"), "Annual Report 2024.pdf");
    EXPECT_EQ(sanitizeDisplayName("C:\\Users\\me\\scan.pdf"), "scan.pdf");
    EXPECT_EQ(sanitizeDisplayName("a\"b;c.pdf"), "a_b_c.pdf");
}

TEST(SessionKeyTest, HiddenAndDotNamesFallBack) {
    EXPECT_EQ(sanitizeDisplayName(".."), std::string(kFallbackDisplayName));
    EXPECT_EQ(sanitizeDisplayName("dir/"), std::string(kFallbackDisplayName));
    EXPECT_EQ(sanitizeDisplayName(".hidden.pdf"), "hidden.pdf");
}

TEST(SessionKeyTest, RejectsEmptyAndNul) {
    EXPECT_THROW((void)SessionKey::fromFileName(""), InvalidFileNameError);
    EXPECT_THROW((void)SessionKey::fromFileName(std::string("a\0b.pdf", 7)), InvalidFileNameError);
}

TEST(SessionKeyTest, LooksLikeSessionIdRejectsOtherNames) {
    EXPECT_FALSE(looksLikeSessionId("engine"));
    EXPECT_FALSE(looksLikeSessionId("0123456789ABCDEF"));
    EXPECT_FALSE(looksLikeSessionId("0123456789abcde"));
    EXPECT_TRUE(looksLikeSessionId("0123456789abcdef"));
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(SessionKeyProperty, IdIsAlwaysSixteenLowercaseHex, (const std::string& name)) {
    RC_PRE(!name.empty());
    RC_PRE(name.find('\0') == std::string::npos);

    const SessionKey key = SessionKey::fromFileName(name);
    RC_ASSERT(looksLikeSessionId(key.id));
    RC_ASSERT(key.id == makeSessionId(name));
}

RC_GTEST_PROP(SessionKeyProperty, DisplayNameIsSafeBasename, (const std::string& name)) {
    const std::string display = sanitizeDisplayName(name);

    RC_ASSERT(!display.empty());
    RC_ASSERT(display.size() <= kMaxDisplayNameLength);
    RC_ASSERT(display.find('/') == std::string::npos);
    RC_ASSERT(display.find('\\') == std::string::npos);
    RC_ASSERT(display.front() != '.');
    for (char c : display) {
        RC_ASSERT(isSafeDisplayChar(c));
    }
}

}  // namespace pds::session::test
