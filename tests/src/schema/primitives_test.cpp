#include <gtest/gtest.h>
#include <provenance/schema/primitives.hpp>

#include <string>
#include <string_view>

TEST(primitives, make_bytes_preserves_string_contents) {
  auto bytes = provenance::schema::make_bytes(std::string_view{"p1"});
  ASSERT_EQ(bytes.size(), 2u);
  EXPECT_EQ(bytes[0], 'p');
  EXPECT_EQ(bytes[1], '1');
  EXPECT_EQ(provenance::schema::make_string(bytes), "p1");
}

TEST(primitives, bytes_view_aliases_source_string) {
  auto source = std::string{"CompanyA"};
  auto view = provenance::schema::make_bytes_view(source);
  EXPECT_EQ(view.size(), source.size());
  EXPECT_EQ(provenance::schema::make_string_view(view), source);
}

TEST(primitives, to_hex_renders_lowercase_pairs) {
  auto bytes = provenance::schema::bytes_t{0x00, 0x7F, 0xAB, 0xFF};
  EXPECT_EQ(provenance::schema::to_hex(provenance::schema::make_bytes_view(bytes)),
            "007fabff");
}

TEST(primitives, to_hex_of_empty_is_empty) {
  EXPECT_TRUE(provenance::schema::to_hex(provenance::schema::bytes_view_t{}).empty());
}
