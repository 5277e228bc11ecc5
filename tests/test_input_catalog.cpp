/**
 * @file test_input_catalog.cpp
 * @brief Tests for input enumeration from a data directory
 *
 * Each test builds a throwaway data directory under the system temp path.
 */

#include <gtest/gtest.h>
#include "input_catalog.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

class InputCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() /
                ("sftp_writer_catalog_" + std::to_string(::getpid()) + "_" + info->name());
        fs::remove_all(root_);
        fs::create_directories(root_ / "in" / "tables");
        fs::create_directories(root_ / "in" / "files");
    }

    void TearDown() override { fs::remove_all(root_); }

    void write(const fs::path& relative, const std::string& content = "x") {
        std::ofstream out(root_ / relative);
        out << content;
    }

    fs::path root_;
};

} // namespace

TEST_F(InputCatalogTest, EmptyDataDirHasNoTasks) {
    InputCatalog catalog(root_.string());
    auto tasks = catalog.tasks();
    ASSERT_TRUE(tasks.has_value());
    EXPECT_TRUE(tasks->empty());
}

TEST_F(InputCatalogTest, MissingInputDirectoriesAreSkipped) {
    fs::remove_all(root_ / "in");
    InputCatalog catalog(root_.string());
    auto tasks = catalog.tasks();
    ASSERT_TRUE(tasks.has_value());
    EXPECT_TRUE(tasks->empty());
}

TEST_F(InputCatalogTest, TablesSortedAndManifestsSkipped) {
    write("in/tables/users.csv");
    write("in/tables/orders.csv");
    write("in/tables/orders.csv.manifest", R"({"destination": "out.c-main.orders"})");

    InputCatalog catalog(root_.string());
    auto tables = catalog.tables();
    ASSERT_TRUE(tables.has_value());
    ASSERT_EQ(tables->size(), 2u);
    EXPECT_EQ((*tables)[0].name, "orders.csv");
    EXPECT_EQ((*tables)[1].name, "users.csv");
    EXPECT_EQ((*tables)[0].kind, ArtifactKind::Table);
    EXPECT_EQ((*tables)[0].localPath, (root_ / "in" / "tables" / "orders.csv").string());
}

TEST_F(InputCatalogTest, KeepsLatestFilePerName) {
    write("in/files/100_report.pdf");
    write("in/files/250_report.pdf");
    write("in/files/120_notes.txt");

    InputCatalog catalog(root_.string());
    auto files = catalog.latestFiles();
    ASSERT_TRUE(files.has_value());
    ASSERT_EQ(files->size(), 2u);
    EXPECT_EQ((*files)[0].name, "notes.txt");
    EXPECT_EQ((*files)[1].name, "report.pdf");
    EXPECT_EQ((*files)[1].localPath, (root_ / "in" / "files" / "250_report.pdf").string());
    EXPECT_EQ((*files)[1].kind, ArtifactKind::File);
}

TEST_F(InputCatalogTest, ManifestOverridesIdAndName) {
    write("in/files/100_upload.bin");
    write("in/files/100_upload.bin.manifest", R"({"id": 900, "name": "data.bin"})");
    write("in/files/500_data.bin");

    InputCatalog catalog(root_.string());
    auto files = catalog.latestFiles();
    ASSERT_TRUE(files.has_value());
    ASSERT_EQ(files->size(), 1u);
    EXPECT_EQ((*files)[0].name, "data.bin");
    EXPECT_EQ((*files)[0].localPath, (root_ / "in" / "files" / "100_upload.bin").string());
}

TEST_F(InputCatalogTest, BrokenManifestIsConfigurationError) {
    write("in/files/1_a.txt");
    write("in/files/1_a.txt.manifest", "{ broken");

    InputCatalog catalog(root_.string());
    auto files = catalog.latestFiles();
    ASSERT_FALSE(files.has_value());
    EXPECT_EQ(files.error().kind, ErrorKind::InvalidConfiguration);
}

TEST_F(InputCatalogTest, TablesComeBeforeFiles) {
    write("in/files/7_alpha.txt");
    write("in/tables/zeta.csv");

    InputCatalog catalog(root_.string());
    auto tasks = catalog.tasks();
    ASSERT_TRUE(tasks.has_value());
    ASSERT_EQ(tasks->size(), 2u);
    EXPECT_EQ((*tasks)[0].name, "zeta.csv");
    EXPECT_EQ((*tasks)[0].kind, ArtifactKind::Table);
    EXPECT_EQ((*tasks)[1].name, "alpha.txt");
    EXPECT_EQ((*tasks)[1].kind, ArtifactKind::File);
}

TEST(InputCatalogNameTest, SplitsStoredNames) {
    auto stored = InputCatalog::splitStoredName("12345_report_final.csv");
    EXPECT_EQ(stored.id, 12345);
    EXPECT_EQ(stored.name, "report_final.csv");

    auto plain = InputCatalog::splitStoredName("report.csv");
    EXPECT_EQ(plain.id, 0);
    EXPECT_EQ(plain.name, "report.csv");

    auto notNumeric = InputCatalog::splitStoredName("v2_report.csv");
    EXPECT_EQ(notNumeric.id, 0);
    EXPECT_EQ(notNumeric.name, "v2_report.csv");
}
