// =============================================================================
// pdf-shrink - Test Entry Point
// =============================================================================
// Shared main for every test executable: the PDS_LOG_* macros need an
// initialized logger.
// =============================================================================

#include <gtest/gtest.h>

#include "pds/common/logger.h"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    pds::log::init("", pds::log::Level::kWarning);

    const int result = RUN_ALL_TESTS();

    pds::log::shutdown();
    return result;
}
