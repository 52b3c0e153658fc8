#include <boost/log/core.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

int main(int argc, char **argv)
{
    // без Logger::Guard Boost.Log пишет всё в консоль
    boost::log::core::get()->set_logging_enabled(false);

    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
