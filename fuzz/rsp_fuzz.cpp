#include <rs/rsp.hpp>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <unistd.h>

namespace {

// uses the first columns of common test inputs
struct fuzz_reader {
    std::vector<std::string> used_columns() const {
        return {"a", "b", ""};
    }

    std::vector<std::string> build_record(const rs::filtered_row& row) const {
        return row.values();
    }
};

template <typename Parser>
void consume(Parser& p) {
    size_t records = 0;
    while (!p.eof()) {
        try {
            if (p.parse_next()) {
                ++records;
            }
        } catch (const rs::exception&) {
            continue;
        }
    }

    if (records != p.rows()) {
        std::cerr << "record count mismatch" << std::endl;
        std::abort();
    }
}

template <typename Reader, typename... Ts>
void test_rsp_file_mode(const uint8_t* data, size_t size,
                        char delim = rs::default_delimiter) {
    std::string file_name = std::filesystem::temp_directory_path().append(
        "rs_fuzzer" + std::to_string(getpid()) + ".csv");
    FILE* file = std::fopen(file_name.c_str(), "wb");
    if (!file) {
        std::exit(1);
    }
    std::fwrite(data, size, 1, file);
    std::fclose(file);

    try {
        rs::parser<Reader, Ts...> p{file_name, Reader{}, delim};
        consume(p);
    } catch (const rs::exception&) {
        // the session could not be started
    }

    std::remove(file_name.c_str());
}

template <typename Reader, typename... Ts>
void test_rsp_buffer_mode(const uint8_t* data, size_t size,
                          char delim = rs::default_delimiter) {
    try {
        rs::parser<Reader, Ts...> p{reinterpret_cast<const char*>(data), size,
                                    Reader{}, delim};
        consume(p);
    } catch (const rs::exception&) {
        return;
    }
}

template <typename Reader, typename... Ts>
void test_rsp(const uint8_t* data, size_t size) {
    test_rsp_file_mode<Reader, Ts...>(data, size);
    test_rsp_file_mode<Reader, Ts..., rs::throw_on_error>(data, size);

    test_rsp_file_mode<Reader, Ts...>(data, size, ';');
    test_rsp_file_mode<Reader, Ts..., rs::string_error>(data, size, ';');

    test_rsp_buffer_mode<Reader, Ts...>(data, size);
    test_rsp_buffer_mode<Reader, Ts..., rs::throw_on_error>(data, size);

    test_rsp_buffer_mode<Reader, Ts...>(data, size, ';');
    test_rsp_buffer_mode<Reader, Ts..., rs::string_error>(data, size, ';');
}

} /* namespace */

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    using quote = rs::quote<'\''>;
    using small_chunk = rs::chunk_size<3>;

    test_rsp<fuzz_reader>(data, size);
    test_rsp<fuzz_reader, quote>(data, size);
    test_rsp<fuzz_reader, small_chunk>(data, size);
    test_rsp<fuzz_reader, small_chunk, rs::ignore_empty>(data, size);
    test_rsp<fuzz_reader, rs::strict_quotes, rs::unique_header>(data, size);

    test_rsp<rs::population_reader>(data, size);
    test_rsp<rs::property_reader, small_chunk>(data, size);
    test_rsp<rs::service_request_reader, rs::ignore_empty>(data, size);

    return 0;
}
