/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>

#include <tether/internal/spinner_arbiter.h>
#include <tether/internal/timeout_settings.h>

using namespace tether;

TEST(spinner_arbiter_test, mode_only_rises)
{
    spinner_arbiter arbiter;
    EXPECT_EQ(arbiter.get_mode(), spinner_mode::invisible);

    EXPECT_FALSE(arbiter.update(spinner_mode::after_timeout));
    EXPECT_EQ(arbiter.get_mode(), spinner_mode::after_timeout);

    EXPECT_FALSE(arbiter.update(spinner_mode::invisible));
    EXPECT_EQ(arbiter.get_mode(), spinner_mode::after_timeout);

    EXPECT_TRUE(arbiter.update(spinner_mode::instant));
    EXPECT_TRUE(arbiter.update(spinner_mode::after_timeout));
    EXPECT_EQ(arbiter.get_mode(), spinner_mode::instant);
}

TEST(spinner_arbiter_test, reset_returns_to_invisible)
{
    spinner_arbiter arbiter;
    arbiter.update(spinner_mode::instant);
    arbiter.reset();
    EXPECT_EQ(arbiter.get_mode(), spinner_mode::invisible);
}

TEST(spinner_arbiter_test, should_show_follows_mode)
{
    spinner_arbiter arbiter;
    EXPECT_FALSE(arbiter.should_show(true));

    arbiter.update(spinner_mode::after_timeout);
    EXPECT_FALSE(arbiter.should_show(false));
    EXPECT_TRUE(arbiter.should_show(true));

    arbiter.force(spinner_mode::instant);
    EXPECT_TRUE(arbiter.should_show(false));
}

TEST(timeout_settings_test, defaults_and_validation)
{
    static_timeout_settings settings;
    EXPECT_EQ(settings.spinner_timeout(), std::chrono::milliseconds(2000));
    EXPECT_EQ(settings.popup_timeout(), std::chrono::milliseconds(8000));

    EXPECT_FALSE(settings.set_spinner_timeout(std::chrono::milliseconds(0)));
    EXPECT_FALSE(settings.set_popup_timeout(std::chrono::milliseconds(-5)));
    EXPECT_EQ(settings.spinner_timeout(), std::chrono::milliseconds(2000));

    EXPECT_TRUE(settings.set_spinner_timeout(std::chrono::milliseconds(500)));
    EXPECT_EQ(settings.spinner_timeout(), std::chrono::milliseconds(500));
}
