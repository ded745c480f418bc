#include <cstddef>
#include <stdexcept>
#include <thread>

#include <gtest/gtest.h>

#include <structpp/common.hpp>
#include <structpp/settings.hpp>


namespace structpp::test {

    static_assert(concrete(endian::little) == endian::little);
    static_assert(concrete(endian::big) == endian::big);
    static_assert(concrete(endian::native) != endian::native);

    static_assert(merge(settings{endian::big}, settings{endian::little}) == settings{endian::big});
    static_assert(merge(settings{}, settings{endian::little}) == settings{endian::little});
    static_assert(merge(settings{}, settings{}) == settings{});


    TEST(settings_tests, resolve_precedence) {
        settings const call{endian::big};
        settings const structure{endian::native};
        settings const context{endian::little};

        EXPECT_EQ(resolve(call, structure, context).byte_order, endian::big);
        EXPECT_EQ(resolve({}, structure, context).byte_order, endian::native);
        EXPECT_EQ(resolve({}, {}, context).byte_order, endian::little);
        EXPECT_EQ(resolve(call, {}, context).byte_order, endian::big);
        EXPECT_FALSE(resolve({}, {}, {}).byte_order);
    }


    TEST(settings_tests, root_frame) {
        EXPECT_EQ(settings_context::depth(), 1u);
        EXPECT_EQ(settings_context::current().byte_order, endian::little);
    }

    TEST(settings_tests, pop_root) {
        EXPECT_THROW(settings_context::pop(), empty_stack_error);
        EXPECT_EQ(settings_context::depth(), 1u);
    }

    TEST(settings_tests, update_root) {
        EXPECT_THROW(settings_context::update(settings{endian::big}), empty_stack_error);
        EXPECT_EQ(settings_context::current().byte_order, endian::little);
    }

    TEST(settings_tests, push_update_pop) {
        settings_context::push();
        EXPECT_EQ(settings_context::depth(), 2u);
        EXPECT_EQ(settings_context::current().byte_order, endian::little);

        settings_context::update(settings{endian::big});
        EXPECT_EQ(settings_context::current().byte_order, endian::big);

        // Unset options don't change the frame.
        settings_context::update(settings{});
        EXPECT_EQ(settings_context::current().byte_order, endian::big);

        settings_context::push();
        EXPECT_EQ(settings_context::current().byte_order, endian::big);
        settings_context::update(settings{endian::little});
        EXPECT_EQ(settings_context::current().byte_order, endian::little);

        settings_context::pop();
        EXPECT_EQ(settings_context::current().byte_order, endian::big);
        settings_context::pop();
        EXPECT_EQ(settings_context::current().byte_order, endian::little);
        EXPECT_EQ(settings_context::depth(), 1u);
    }


    TEST(settings_tests, current_is_a_copy) {
        scoped_settings const scope{settings{endian::big}};
        auto const before = settings_context::current();
        for (int i = 0; i < 64; ++i) {
            settings_context::push();
            settings_context::update(settings{endian::little});
        }
        EXPECT_EQ(before.byte_order, endian::big);
        EXPECT_EQ(settings_context::current().byte_order, endian::little);
        for (int i = 0; i < 64; ++i) {
            settings_context::pop();
        }
        EXPECT_EQ(settings_context::current(), before);
    }

    TEST(settings_tests, scoped_settings_nesting) {
        {
            scoped_settings const outer{settings{endian::big}};
            EXPECT_EQ(settings_context::depth(), 2u);
            EXPECT_EQ(settings_context::current().byte_order, endian::big);
            {
                scoped_settings const inner;
                EXPECT_EQ(settings_context::depth(), 3u);
                EXPECT_EQ(settings_context::current().byte_order, endian::big);
            }
            EXPECT_EQ(settings_context::depth(), 2u);
        }
        EXPECT_EQ(settings_context::depth(), 1u);
        EXPECT_EQ(settings_context::current().byte_order, endian::little);
    }

    TEST(settings_tests, scoped_settings_unwinds_on_exception) {
        try {
            scoped_settings const scope{settings{endian::big}};
            settings_context::push();
            settings_context::push();
            throw std::runtime_error{"error"};
        }
        catch (std::runtime_error const&) {}
        EXPECT_EQ(settings_context::depth(), 1u);
        EXPECT_EQ(settings_context::current().byte_order, endian::little);
    }

    TEST(settings_tests, thread_local_stacks) {
        scoped_settings const scope{settings{endian::big}};
        std::size_t other_depth = 0;
        endian other_order = endian::native;
        std::thread other{[&] {
            other_depth = settings_context::depth();
            other_order = *settings_context::current().byte_order;
        }};
        other.join();
        EXPECT_EQ(other_depth, 1u);
        EXPECT_EQ(other_order, endian::little);
        EXPECT_EQ(settings_context::current().byte_order, endian::big);
    }

}
