#include "test_helpers.hpp"
#include <rs/tokenizer.hpp>

namespace {

using rows = std::vector<std::vector<std::string>>;

template <typename... Options>
rows tokenize(rs::buffered_source& source, char delim = ',') {
    rs::tokenizer<Options...> tokenizer{delim};
    rows out;
    while (tokenizer.read_row(source)) {
        out.push_back(tokenizer.row().to_vector());
    }
    return out;
}

// tokenizes the content from memory and from a file read with
// multiple chunk sizes, all of them have to give the same rows
template <typename... Options>
rows tokenize_all(const std::string& content, char delim = ',') {
    rs::buffered_source memory{content.data(), content.size()};
    auto expected = tokenize<Options...>(memory, delim);

    unique_file_name f{"tokenizer"};
    write_file(f.name, content);
    for (size_t chunk_size : {1, 2, 3, 5, 64, 16 * 1024}) {
        rs::buffered_source file{f.name, chunk_size};
        REQUIRE(file.is_open());
        CHECK_EQ(tokenize<Options...>(file, delim), expected);
    }
    return expected;
}

} /* namespace */

TEST_CASE("tokenizer simple rows") {
    CHECK_EQ(tokenize_all("a,b,c\n1,2,3\n"), rows{{"a", "b", "c"}, {"1", "2", "3"}});
    CHECK_EQ(tokenize_all("x"), rows{{"x"}});
    CHECK_EQ(tokenize_all(""), rows{});
    CHECK_EQ(tokenize_all(",,"), rows{{"", "", ""}});
    CHECK_EQ(tokenize_all("a,\n,b\n"), rows{{"a", ""}, {"", "b"}});
}

TEST_CASE("tokenizer missing trailing terminator gives the same rows") {
    CHECK_EQ(tokenize_all("a,b\n1,2"), tokenize_all("a,b\n1,2\n"));
    CHECK_EQ(tokenize_all("a,b\r\n1,2"), tokenize_all("a,b\r\n1,2\r\n"));
    CHECK_EQ(tokenize_all("a,\"b\"\n1,\"2\""),
             tokenize_all("a,\"b\"\n1,\"2\"\n"));
}

TEST_CASE("tokenizer line terminators") {
    rows expected{{"a", "b"}, {"1", "2"}, {"3", "4"}};
    CHECK_EQ(tokenize_all("a,b\n1,2\n3,4\n"), expected);
    CHECK_EQ(tokenize_all("a,b\r\n1,2\r\n3,4\r\n"), expected);
    CHECK_EQ(tokenize_all("a,b\r1,2\r3,4\r"), expected);
    CHECK_EQ(tokenize_all("a,b\r\n1,2\n3,4\r"), expected);
}

TEST_CASE("tokenizer quoted fields") {
    CHECK_EQ(tokenize_all("a,b,c\n1,\"x,y\",3\n"),
             rows{{"a", "b", "c"}, {"1", "x,y", "3"}});
    CHECK_EQ(tokenize_all("h1,h2\n\"say \"\"hi\"\"\",2\n"),
             rows{{"h1", "h2"}, {"say \"hi\"", "2"}});
    CHECK_EQ(tokenize_all("\"\""), rows{{""}});
    CHECK_EQ(tokenize_all("\"\"\"\""), rows{{"\""}});
    CHECK_EQ(tokenize_all("\"a\",\"\",\"c\"\n"), rows{{"a", "", "c"}});
    CHECK_EQ(tokenize_all("a\"b\",c\n"), rows{{"ab", "c"}});
}

TEST_CASE("tokenizer multiline quoted fields") {
    auto out = tokenize_all("id,text\n1,\"first\nsecond\r\nthird\"\n2,x\n");
    CHECK_EQ(out, rows{{"id", "text"}, {"1", "first\nsecond\r\nthird"},
                       {"2", "x"}});

    std::string long_field(1000, 'z');
    long_field[500] = '\n';
    out = tokenize_all("\"" + long_field + "\",end\n");
    CHECK_EQ(out, rows{{long_field, "end"}});
}

TEST_CASE("tokenizer quote round trip") {
    for (const std::string field :
         {"plain", "with,delimiter", "with \"quotes\"", "\"", "\"\"",
          "line\nbreak", "cr\rlf\r\n", "", " spaced "}) {
        std::string escaped;
        for (auto c : field) {
            escaped.push_back(c);
            if (c == '"') {
                escaped.push_back('"');
            }
        }

        auto out = tokenize_all("\"" + escaped + "\",next\n");
        REQUIRE_EQ(out.size(), 1);
        CHECK_EQ(out[0], std::vector<std::string>{field, "next"});
    }
}

TEST_CASE("tokenizer custom delimiter and quote") {
    CHECK_EQ(tokenize_all("a;b;c\n1;'x;y';3\n", ';'),
             rows{{"a", "b", "c"}, {"1", "'x", "y'", "3"}});
    CHECK_EQ(tokenize_all<rs::quote<'\''>>("a;b;c\n1;'x;y';3\n", ';'),
             rows{{"a", "b", "c"}, {"1", "x;y", "3"}});
    CHECK_EQ(tokenize_all<rs::quote<'\''>>("a\t'b''c'\n", '\t'),
             rows{{"a", "b'c"}});
    CHECK_EQ(tokenize_all("a\tb\n", '\t'), rows{{"a", "b"}});
}

TEST_CASE("tokenizer empty lines") {
    CHECK_EQ(tokenize_all("a\n\nb\n"), rows{{"a"}, {""}, {"b"}});
    CHECK_EQ(tokenize_all<rs::ignore_empty>("a\n\nb\n\r\n\n"),
             rows{{"a"}, {"b"}});
    CHECK_EQ(tokenize_all<rs::ignore_empty>("\n\n"), rows{});

    // a quoted empty field is not an empty line
    CHECK_EQ(tokenize_all<rs::ignore_empty>("a\n\"\"\nb\n"),
             rows{{"a"}, {""}, {"b"}});
}

TEST_CASE("tokenizer malformed quoting") {
    std::string content = "a,\"b\"c,d\n1,2,3\n";
    rs::buffered_source source{content.data(), content.size()};
    rs::tokenizer<> tokenizer;

    REQUIRE(tokenizer.read_row(source));
    CHECK(tokenizer.malformed());
    CHECK_EQ(tokenizer.malformed_position(), 5);
    CHECK_EQ(tokenizer.row().to_vector(),
             std::vector<std::string>{"a", "b", "c", "d"});

    REQUIRE(tokenizer.read_row(source));
    CHECK_FALSE(tokenizer.malformed());
    CHECK_EQ(tokenizer.row().to_vector(),
             std::vector<std::string>{"1", "2", "3"});

    CHECK_FALSE(tokenizer.read_row(source));
}

TEST_CASE("tokenizer unterminated quote") {
    std::string content = "a,b\n1,\"open,2\n3\n";
    rs::buffered_source source{content.data(), content.size()};
    rs::tokenizer<> tokenizer;

    REQUIRE(tokenizer.read_row(source));
    CHECK_FALSE(tokenizer.malformed());

    REQUIRE(tokenizer.read_row(source));
    CHECK(tokenizer.malformed());
    CHECK_EQ(tokenizer.row().to_vector(),
             std::vector<std::string>{"1", "open,2\n3\n"});

    CHECK_FALSE(tokenizer.read_row(source));
}

TEST_CASE("tokenizer line and row counters") {
    std::string content = "a,b\n\"1\n2\",3\r\n4,5";
    rs::buffered_source source{content.data(), content.size()};
    rs::tokenizer<> tokenizer;

    REQUIRE(tokenizer.read_row(source));
    CHECK_EQ(tokenizer.row_begin_line(), 1);
    CHECK_EQ(tokenizer.line(), 1);

    REQUIRE(tokenizer.read_row(source));
    CHECK_EQ(tokenizer.row_begin_line(), 2);
    CHECK_EQ(tokenizer.line(), 3);

    REQUIRE(tokenizer.read_row(source));
    CHECK_EQ(tokenizer.row_begin_line(), 4);
    CHECK_EQ(tokenizer.line(), 4);
    CHECK_EQ(tokenizer.rows(), 3);
    CHECK_EQ(tokenizer.position(), content.size());

    CHECK_FALSE(tokenizer.read_row(source));
    CHECK_EQ(tokenizer.rows(), 3);
}

TEST_CASE("tokenizer delimiter validation") {
    CHECK(rs::tokenizer<>{','}.valid_delimiter());
    CHECK(rs::tokenizer<>{'\t'}.valid_delimiter());
    CHECK_FALSE(rs::tokenizer<>{'"'}.valid_delimiter());
    CHECK_FALSE(rs::tokenizer<>{'\n'}.valid_delimiter());
    CHECK_FALSE(rs::tokenizer<>{'\r'}.valid_delimiter());
    CHECK(rs::tokenizer<rs::quote<'\''>>{'"'}.valid_delimiter());
    CHECK_FALSE(rs::tokenizer<rs::quote<'\''>>{'\''}.valid_delimiter());
}

TEST_CASE("tokenizer row storage") {
    std::string content = "abc,de,\nx\n";
    rs::buffered_source source{content.data(), content.size()};
    rs::tokenizer<> tokenizer;

    REQUIRE(tokenizer.read_row(source));
    const auto& row = tokenizer.row();
    CHECK_EQ(row.size(), 3);
    CHECK_EQ(row.byte_size(), 5);
    CHECK_EQ(row[0], "abc");
    CHECK_EQ(row.at(1), "de");
    CHECK_EQ(row.at(2), "");
    CHECK_THROWS_AS((void)row.at(3), std::out_of_range);

    REQUIRE(tokenizer.read_row(source));
    CHECK_EQ(row.size(), 1);
    CHECK_EQ(row[0], "x");
}
