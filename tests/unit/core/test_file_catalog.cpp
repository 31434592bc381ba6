/**
 * @file test_file_catalog.cpp
 * @brief Unit tests for file_catalog and range_reader
 */

#include <gtest/gtest.h>

#include <usb_responder/core/file_catalog.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <vector>

namespace usb_responder::test {

class FileCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("usb_responder_catalog_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    // Byte i of every test file is i % 251
    auto create_test_file(const std::string& name, std::size_t size) -> file_input {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(i % 251);
            file.write(&byte, 1);
        }
        return {path, size};
    }

    static auto expected_bytes(uint64_t offset, std::size_t length) -> std::vector<std::byte> {
        std::vector<std::byte> out(length);
        for (std::size_t i = 0; i < length; ++i) {
            out[i] = static_cast<std::byte>((offset + i) % 251);
        }
        return out;
    }

    std::filesystem::path test_dir_;
};

// =============================================================================
// Catalog lookups
// =============================================================================

TEST_F(FileCatalogTest, EmptyCatalog) {
    file_catalog catalog;

    EXPECT_TRUE(catalog.empty());
    EXPECT_EQ(catalog.count(), 0u);
    EXPECT_EQ(catalog.total_size(), 0u);

    auto name = catalog.name_of(0);
    ASSERT_FALSE(name.has_value());
    EXPECT_EQ(name.error().code, error_code::index_out_of_range);
}

TEST_F(FileCatalogTest, IndicesFollowInputOrder) {
    file_catalog catalog({create_test_file("b.nsp", 100), create_test_file("a.xci", 300)});

    ASSERT_EQ(catalog.count(), 2u);
    EXPECT_EQ(catalog.total_size(), 400u);

    EXPECT_EQ(catalog.name_of(0).value(), "b.nsp");
    EXPECT_EQ(catalog.size_of(0).value(), 100u);
    EXPECT_EQ(catalog.name_of(1).value(), "a.xci");
    EXPECT_EQ(catalog.size_of(1).value(), 300u);

    auto entry = catalog.entry(1);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry.value().index, 1u);
    EXPECT_EQ(entry.value().path, test_dir_ / "a.xci");
}

TEST_F(FileCatalogTest, OutOfRangeIndex) {
    file_catalog catalog({create_test_file("a.nsp", 10)});

    EXPECT_EQ(catalog.size_of(1).error().code, error_code::index_out_of_range);
    EXPECT_EQ(catalog.entry(7).error().code, error_code::index_out_of_range);
    EXPECT_EQ(catalog.open_range_reader(1, 0, 1).error().code,
              error_code::index_out_of_range);
}

TEST_F(FileCatalogTest, FindByName) {
    file_catalog catalog({create_test_file("a.nsp", 10), create_test_file("b.nsp", 10)});

    auto found = catalog.find("b.nsp");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, 1u);
    EXPECT_FALSE(catalog.find("c.nsp").has_value());
}

// =============================================================================
// Range reader
// =============================================================================

TEST_F(FileCatalogTest, ReadsExactRange) {
    file_catalog catalog({create_test_file("a.nsp", 1000)});

    auto reader = catalog.open_range_reader(0, 500, 300);
    ASSERT_TRUE(reader.has_value()) << reader.error().message;
    EXPECT_EQ(reader.value().position(), 500u);
    EXPECT_EQ(reader.value().remaining(), 300u);

    std::vector<std::byte> buffer(1024);
    auto read = reader.value().read(buffer);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(read.value(), 300u);

    buffer.resize(300);
    EXPECT_EQ(buffer, expected_bytes(500, 300));
    EXPECT_EQ(reader.value().remaining(), 0u);
    EXPECT_EQ(reader.value().position(), 800u);

    auto done = reader.value().read(buffer);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value(), 0u);
}

TEST_F(FileCatalogTest, ReadsInPieces) {
    file_catalog catalog({create_test_file("a.nsp", 1000)});
    auto reader = catalog.open_range_reader(0, 0, 1000);
    ASSERT_TRUE(reader.has_value());

    std::vector<std::byte> collected;
    std::vector<std::byte> buffer(256);
    while (reader.value().remaining() > 0) {
        auto n = reader.value().read(buffer);
        ASSERT_TRUE(n.has_value());
        collected.insert(collected.end(), buffer.begin(),
                         buffer.begin() + static_cast<std::ptrdiff_t>(n.value()));
    }

    EXPECT_EQ(collected, expected_bytes(0, 1000));
}

TEST_F(FileCatalogTest, RangeEndingAtFileSizeIsValid) {
    file_catalog catalog({create_test_file("a.nsp", 1000)});

    EXPECT_TRUE(catalog.open_range_reader(0, 1000, 0).has_value());
    EXPECT_TRUE(catalog.open_range_reader(0, 999, 1).has_value());
}

TEST_F(FileCatalogTest, RangePastEndIsInvalid) {
    file_catalog catalog({create_test_file("a.nsp", 1000)});

    EXPECT_EQ(catalog.open_range_reader(0, 900, 200).error().code, error_code::range_invalid);
    EXPECT_EQ(catalog.open_range_reader(0, 1001, 0).error().code, error_code::range_invalid);
    EXPECT_EQ(catalog.open_range_reader(0, UINT64_MAX, 2).error().code,
              error_code::range_invalid);
}

TEST_F(FileCatalogTest, DeletedFileIsIoError) {
    auto input = create_test_file("gone.nsp", 100);
    file_catalog catalog({input});
    std::filesystem::remove(input.path);

    auto reader = catalog.open_range_reader(0, 0, 10);
    ASSERT_FALSE(reader.has_value());
    EXPECT_EQ(reader.error().code, error_code::io_error);
}

TEST_F(FileCatalogTest, ShrunkFileIsShortRead) {
    auto input = create_test_file("shrunk.nsp", 1000);
    file_catalog catalog({input});
    std::filesystem::resize_file(input.path, 100);

    auto reader = catalog.open_range_reader(0, 50, 500);
    ASSERT_TRUE(reader.has_value());

    std::vector<std::byte> buffer(500);
    auto read = reader.value().read(buffer);
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error().code, error_code::io_error);
}

}  // namespace usb_responder::test
