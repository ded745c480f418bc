#pragma once

#include <gtest/gtest.h>

#include <structpp/settings.hpp>


namespace structpp::test {

    // Runs each test inside its own little endian settings frame, which is discarded afterwards.
    class settings_test : public ::testing::Test {
    private:
        scoped_settings _settings{settings{endian::little}};
    };

}
