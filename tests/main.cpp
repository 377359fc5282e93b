#include "core/Log.h"
#include <gtest/gtest.h>

int main( int argc, char** argv )
{
    ::testing::InitGoogleTest( &argc, argv );

    TankTwin::Log::Init();
    // Clamp and drop events log at trace level; keep test output readable
    TankTwin::Log::SetLevel( spdlog::level::info );

    return RUN_ALL_TESTS();
}
