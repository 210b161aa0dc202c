#include <gtest/gtest.h>

// Only GTest::gtest is linked (not gtest_main), so the runner is invoked explicitly.
int main(int argc, char** argv){
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
