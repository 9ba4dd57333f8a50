#include "test_helpers.hpp"
#include <rs/header.hpp>

namespace {

rs::header_index make_header(const std::string& content) {
    rs::buffered_source source{content.data(), content.size()};
    rs::tokenizer<> tokenizer;
    REQUIRE(tokenizer.read_row(source));
    return rs::header_index{tokenizer.row()};
}

} /* namespace */

TEST_CASE("header index positions") {
    auto header = make_header("zip_code,population,\"name, full\"\n1,2,3\n");

    CHECK_EQ(header.size(), 3);
    CHECK_FALSE(header.empty());
    CHECK_EQ(header.names(),
             std::vector<std::string>{"zip_code", "population", "name, full"});

    CHECK_EQ(header.position_of("zip_code"), 0);
    CHECK_EQ(header.position_of("population"), 1);
    CHECK_EQ(header.position_of("name, full"), 2);
    CHECK_FALSE(header.position_of("name").has_value());
    CHECK_FALSE(header.position_of("").has_value());
    CHECK_FALSE(header.position_of("Zip_code").has_value());

    CHECK(header.contains("population"));
    CHECK_FALSE(header.contains("lat"));
    CHECK(header.duplicates().empty());
}

TEST_CASE("header index lookups are stable") {
    auto header = make_header("a,b,c");
    for (int i = 0; i < 3; ++i) {
        CHECK_EQ(header.position_of("c"), 2);
        CHECK_EQ(header.position_of(std::string{"b"}), 1);
        CHECK_EQ(header.position_of(std::string_view{"a"}), 0);
    }
}

TEST_CASE("header index duplicate names") {
    auto header = make_header("a,b,a,c,b,a\n");

    CHECK_EQ(header.size(), 6);
    CHECK_EQ(header.position_of("a"), 5);
    CHECK_EQ(header.position_of("b"), 4);
    CHECK_EQ(header.position_of("c"), 3);
    CHECK_EQ(header.duplicates(), std::vector<std::string>{"a", "b"});
}

TEST_CASE("header index empty names") {
    auto header = make_header(",x,\n");
    CHECK_EQ(header.size(), 3);
    CHECK_EQ(header.position_of(""), 2);
    CHECK_EQ(header.position_of("x"), 1);
    CHECK_EQ(header.duplicates(), std::vector<std::string>{""});
}

TEST_CASE("header index default constructed") {
    rs::header_index header;
    CHECK(header.empty());
    CHECK_EQ(header.size(), 0);
    CHECK_FALSE(header.contains("a"));
}
