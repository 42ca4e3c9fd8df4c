#include <gtest/gtest.h>

#include <opencv2/core/utils/logger.hpp>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // 测试输出里不需要 OpenCV 的调试信息
    cv::utils::logging::setLogLevel(cv::utils::logging::LOG_LEVEL_ERROR);
    return RUN_ALL_TESTS();
}
