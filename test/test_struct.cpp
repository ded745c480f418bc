#include <cstddef>
#include <optional>
#include <stdexcept>

#include <gtest/gtest.h>

#include <structpp/common.hpp>
#include <structpp/nested.hpp>
#include <structpp/scalar.hpp>
#include <structpp/struct.hpp>
#include <structpp/typed_array.hpp>
#include <structpp/variable_array.hpp>

#include "helpers/struct.hpp"


namespace structpp::test {

    TEST(struct_tests, field_lookup) {
        auto const& definition = *simple_struct();
        EXPECT_EQ(definition.name(), "simple");
        EXPECT_EQ(definition.size(), 3u);
        EXPECT_EQ(definition.at(0).name, "b");
        EXPECT_EQ(definition.at(2).name, "x");
        EXPECT_EQ(definition.index_of("a"), 1u);
        EXPECT_EQ(definition.find("x"), std::optional<std::size_t>{2});
        EXPECT_FALSE(definition.find("y"));
        EXPECT_THROW((void)definition.at(3), std::out_of_range);
        EXPECT_THROW((void)definition.index_of("y"), std::out_of_range);
    }

    TEST(struct_tests, fields_in_declaration_order) {
        auto const fields = simple_struct()->fields();
        ASSERT_EQ(fields.size(), 3u);
        for (std::size_t i = 0; i < fields.size(); ++i) {
            EXPECT_EQ(fields[i].index, i);
        }
    }

    TEST(struct_tests, min_length) {
        EXPECT_EQ(small_struct()->min_length(), 1u);
        EXPECT_EQ(simple_struct()->min_length(), 4u);
        EXPECT_EQ(complicated_struct()->min_length(), 1u + 3u * 4u + 4u);
        EXPECT_EQ(packet_struct()->min_length(), 5u);
    }

    TEST(struct_tests, variable_length) {
        EXPECT_FALSE(simple_struct()->variable_length());
        EXPECT_FALSE(complicated_struct()->variable_length());
        EXPECT_TRUE(packet_struct()->variable_length());
    }

    TEST(struct_tests, empty_struct) {
        auto const definition = struct_definition::create("empty", {});
        EXPECT_EQ(definition->size(), 0u);
        EXPECT_EQ(definition->min_length(), 0u);
        EXPECT_FALSE(definition->variable_length());
    }

    TEST(struct_tests, struct_settings) {
        EXPECT_EQ(big_endian_struct()->struct_settings().byte_order, endian::big);
        EXPECT_FALSE(simple_struct()->struct_settings().byte_order);
    }


    TEST(struct_tests, variable_length_field_last) {
        auto const definition = struct_definition::create("trailing", {
            {"count", uint8()},
            {"data", variable_array(1, 4)}
        });
        EXPECT_TRUE(definition->variable_length());
    }

    TEST(struct_tests, variable_length_field_not_last) {
        EXPECT_THROW((void)struct_definition::create("bad", {
            {"data", variable_array(5, 7)},
            {"after", uint8()}
        }), definition_error);
    }

    TEST(struct_tests, multiple_variable_length_fields) {
        EXPECT_THROW((void)struct_definition::create("bad", {
            {"first", variable_array(0, 4)},
            {"second", variable_array(0, 4)}
        }), definition_error);
    }

    TEST(struct_tests, nested_variable_length_struct_not_last) {
        EXPECT_THROW((void)struct_definition::create("bad", {
            {"packet", nested(packet_struct())},
            {"after", uint8()}
        }), definition_error);
    }

    TEST(struct_tests, nested_variable_length_struct_last) {
        auto const definition = struct_definition::create("wrapper", {
            {"before", uint8()},
            {"packet", nested(packet_struct())}
        });
        EXPECT_TRUE(definition->variable_length());
    }

    TEST(struct_tests, duplicate_field_name) {
        EXPECT_THROW((void)struct_definition::create("bad", {
            {"a", uint8()},
            {"b", uint8()},
            {"a", uint16()}
        }), definition_error);
    }

    TEST(struct_tests, empty_field_name) {
        EXPECT_THROW((void)struct_definition::create("bad", {{"", uint8()}}), definition_error);
    }

    TEST(struct_tests, missing_formatter) {
        EXPECT_THROW((void)struct_definition::create("bad", {{"a", nullptr}}), definition_error);
    }

}
