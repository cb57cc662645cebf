#include <gtest/gtest.h>
#include "../src/relocator.hpp"
#include "../src/exception.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class RelocatorTest : public ::testing::Test {
protected:
    fs::path test_root;
    const std::string artifact = "veracode-cli_2.0.0_windows_x86.zip";

    void SetUp() override {
        test_root = fs::absolute("tmp_relocator_test");
        fs::remove_all(test_root);
        fs::create_directories(test_root);
    }

    void TearDown() override {
        fs::remove_all(test_root);
    }

    void stage_extracted(const std::string& marker) {
        fs::path folder = test_root / "veracode-temp" / "veracode-cli_2.0.0_windows_x86";
        fs::create_directories(folder);
        std::ofstream(folder / "veracode") << marker;
    }
};

TEST(ExtractedFolderNameTest, StripsArchiveExtension) {
    EXPECT_EQ(extracted_folder_name("veracode-cli_2.0.0_windows_x86.zip"), "veracode-cli_2.0.0_windows_x86");
    EXPECT_EQ(extracted_folder_name("veracode-cli_2.0.0_linux_x86.tar.gz"), "veracode-cli_2.0.0_linux_x86");
    EXPECT_EQ(extracted_folder_name("veracode-cli_2.0.0.tgz"), "veracode-cli_2.0.0");
    EXPECT_EQ(extracted_folder_name("README"), "README");
    EXPECT_EQ(extracted_folder_name(".zip"), ".zip");
}

TEST_F(RelocatorTest, MovesIntoInstallDirAndRemovesTemp) {
    stage_extracted("new");
    fs::path installed = relocate_installation(artifact, test_root);

    EXPECT_EQ(installed, test_root / "veracode");
    EXPECT_TRUE(fs::exists(installed / "veracode"));
    EXPECT_FALSE(fs::exists(test_root / "veracode-temp"));
}

TEST_F(RelocatorTest, ReplacesPreviousInstallation) {
    fs::create_directories(test_root / "veracode" / "old-plugin");
    stage_extracted("new");

    relocate_installation(artifact, test_root);

    EXPECT_FALSE(fs::exists(test_root / "veracode" / "old-plugin"));
    std::ifstream f(test_root / "veracode" / "veracode");
    std::string content;
    f >> content;
    EXPECT_EQ(content, "new");
}

TEST_F(RelocatorTest, MissingExtractedFolderFails) {
    fs::create_directories(test_root / "veracode-temp" / "something-else");
    fs::create_directories(test_root / "veracode");
    try {
        relocate_installation(artifact, test_root);
        FAIL() << "relocated without an extracted folder";
    } catch (const VciException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Filesystem);
    }
    // Nothing was touched
    EXPECT_TRUE(fs::exists(test_root / "veracode"));
}

TEST_F(RelocatorTest, CleanupRemovesOnlyDownloadedArchives) {
    std::ofstream(test_root / "veracode-cli_2.0.0_windows_x86.zip") << "a";
    std::ofstream(test_root / "veracode-cli_1.9.0_windows_386.zip") << "b";
    std::ofstream(test_root / "veracode-cli_notes.txt") << "keep";
    std::ofstream(test_root / "other.zip") << "keep";
    fs::create_directories(test_root / "veracode");

    EXPECT_EQ(cleanup_downloaded_archives(test_root), 2);

    EXPECT_FALSE(fs::exists(test_root / "veracode-cli_2.0.0_windows_x86.zip"));
    EXPECT_FALSE(fs::exists(test_root / "veracode-cli_1.9.0_windows_386.zip"));
    EXPECT_TRUE(fs::exists(test_root / "veracode-cli_notes.txt"));
    EXPECT_TRUE(fs::exists(test_root / "other.zip"));
    EXPECT_TRUE(fs::exists(test_root / "veracode"));
}

TEST_F(RelocatorTest, CleanupOfMissingDirectoryFails) {
    EXPECT_THROW(cleanup_downloaded_archives(test_root / "absent"), VciException);
}
