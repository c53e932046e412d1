#include <gtest/gtest.h>

#include "catalog/filesystem_scanner.hpp"
#include "testing.hpp"

namespace {

using deployer::FilesystemImageScanner;
using deployer::ImageKind;

std::vector<std::string> Ids(const deployer::ImageList& images) {
    std::vector<std::string> out;
    for (const auto& d : images)
        out.push_back(d.id);
    return out;
}

TEST(FilesystemScannerTest, BaseScanWalksVersionAndBuildDirectories) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp.Join("base/Windows/11/24H2/install.esd"), "esd11");
    testutil::WriteFile(tmp.Join("base/Windows/11/24H2/extra.iso"), "iso");
    testutil::WriteFile(tmp.Join("base/Windows/11/24H2/readme.txt"), "txt");
    testutil::WriteFile(tmp.Join("base/Windows/11/24H2/flash.ffu"), "ffu");
    testutil::WriteFile(tmp.Join("base/Windows/10/22H2/install.esd"), "esd10");
    testutil::WriteFile(tmp.Join("base/Windows/9/A/install.esd"), "esd9");
    testutil::WriteFile(tmp.Join("base/Windows/Drivers/x/install.esd"), "ignored");

    FilesystemImageScanner scanner(tmp.Join("customers"));
    auto out = scanner.ScanBaseImages(tmp.Join("base"));

    EXPECT_EQ(Ids(out.value),
              (std::vector<std::string>{"Windows9-A", "Windows10-22H2", "Windows11-24H2", "Windows11-24H2-extra"}));
    const auto& primary = out.value[2];
    EXPECT_EQ(primary.kind, ImageKind::ESD);
    EXPECT_TRUE(primary.exists);
    EXPECT_EQ(primary.windows_version.value_or(""), "11");
    EXPECT_EQ(primary.build_version.value_or(""), "24H2");
    EXPECT_TRUE(primary.last_modified.has_value());
    EXPECT_EQ(out.value[3].kind, ImageKind::ISO);
    EXPECT_FALSE(out.HasWarnings());
}

TEST(FilesystemScannerTest, MissingBaseRootIsAWarningNotAnError) {
    testutil::TemporaryDirectory tmp;
    FilesystemImageScanner scanner(tmp.Join("customers"));
    auto out = scanner.ScanBaseImages(tmp.Join("nowhere"));
    EXPECT_TRUE(out.value.empty());
    ASSERT_EQ(out.diagnostics.size(), 1u);
    EXPECT_EQ(out.diagnostics[0].severity, deployer::Severity::Warn);
}

TEST(FilesystemScannerTest, CustomerScanFindsWimFilesRecursively) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp.Join("customers/Acme/a.wim"), "a");
    testutil::WriteFile(tmp.Join("customers/Acme/sub/b.WIM"), "b");
    testutil::WriteFile(tmp.Join("customers/Acme/c.esd"), "c");
    testutil::WriteFile(tmp.Join("customers/Other/d.wim"), "d");

    FilesystemImageScanner scanner(tmp.Join("customers"));
    auto out = scanner.ScanCustomerImages("Acme");

    ASSERT_EQ(Ids(out.value), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(out.value[0].kind, ImageKind::WIM);
    EXPECT_EQ(out.value[0].path, tmp.Join("customers/Acme/a.wim"));
    EXPECT_EQ(out.value[1].description, "Discovered in Acme/sub");
    EXPECT_TRUE(out.value[1].exists);
}

TEST(FilesystemScannerTest, CustomerWithoutImageDirectory) {
    testutil::TemporaryDirectory tmp;
    FilesystemImageScanner scanner(tmp.Join("customers"));
    auto out = scanner.ScanCustomerImages("Nobody");
    EXPECT_TRUE(out.value.empty());
    EXPECT_TRUE(out.HasWarnings());
}

TEST(FilesystemScannerTest, BaseImageId) {
    EXPECT_EQ(FilesystemImageScanner::BaseImageId("11", "24H2"), "Windows11-24H2");
    EXPECT_EQ(FilesystemImageScanner::BaseImageId("10", "22H2", "install-n"), "Windows10-22H2-install-n");
}

} // namespace
