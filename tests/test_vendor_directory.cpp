#include "scanner/VendorDirectory.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using net_survey::scanner::VendorDirectory;
namespace fs = std::filesystem;

static fs::path tmp_file(const std::string& name) {
  auto dir = fs::temp_directory_path() / "net-survey-tests";
  fs::create_directories(dir);
  return dir / name;
}

TEST(VendorDirectory, LookupIgnoresCaseAndSeparators) {
  std::istringstream in("prefix,vendor\nD8:EC:5E,Acme Corp\n");
  auto dir = VendorDirectory::LoadFromStream(in);

  EXPECT_EQ(dir.Lookup("d8-ec-5e-00-00-00"), "Acme Corp");
  EXPECT_EQ(dir.Lookup("D8:EC:5E:00:00:00"), "Acme Corp");
  EXPECT_EQ(dir.Lookup("d8ec5e000000"), "Acme Corp");
  EXPECT_EQ(dir.LookupPrefix("D8:EC:5E"), "Acme Corp");
}

TEST(VendorDirectory, UnknownOrMalformedAddressHasNoVendor) {
  std::istringstream in("D8:EC:5E,Acme Corp\n");
  auto dir = VendorDirectory::LoadFromStream(in);

  EXPECT_FALSE(dir.Lookup("AA:BB:CC:11:22:33").has_value());
  EXPECT_FALSE(dir.Lookup("D8:EC").has_value());
  EXPECT_FALSE(dir.Lookup("").has_value());
}

TEST(VendorDirectory, SkipsCommentsHeaderAndBrokenRows) {
  std::istringstream in(
      "# comment line\n"
      "Prefix,Vendor\n"
      "\n"
      "d8-ec-5e,Acme Corp\n"
      "nothex,Broken Inc\n"
      "112233\n"
      "445566,\n"
      "aabbcc,\"Quoted, Inc.\"\r\n");
  auto dir = VendorDirectory::LoadFromStream(in);

  EXPECT_EQ(dir.Size(), 2u);
  EXPECT_EQ(dir.LookupPrefix("D8:EC:5E"), "Acme Corp");
  EXPECT_EQ(dir.LookupPrefix("AA:BB:CC"), "Quoted, Inc.");
  EXPECT_FALSE(dir.LookupPrefix("11:22:33").has_value());
  EXPECT_FALSE(dir.LookupPrefix("44:55:66").has_value());
}

TEST(VendorDirectory, FileRoundTrip) {
  auto path = tmp_file("oui.csv");
  {
    std::ofstream out(path.string());
    out << "prefix,vendor\n3c-5a-b4,Written Vendor\n";
  }

  auto dir = VendorDirectory::LoadFromFile(path.string());
  EXPECT_EQ(dir.Lookup("3C:5A:B4:01:02:03"), "Written Vendor");
  EXPECT_FALSE(dir.Lookup("3C:5A:B5:01:02:03").has_value());
}

TEST(VendorDirectory, MissingFileDegradesToEmpty) {
  auto path = tmp_file("does-not-exist.csv");
  if (fs::exists(path)) fs::remove(path);

  auto dir = VendorDirectory::LoadFromFile(path.string());
  EXPECT_TRUE(dir.Empty());
  EXPECT_FALSE(dir.Lookup("D8:EC:5E:00:00:00").has_value());
}

TEST(VendorDirectory, ShippedDirectoryLoads) {
  auto dir = VendorDirectory::LoadFromFile(NET_SURVEY_SOURCE_OUI_DB);
  EXPECT_FALSE(dir.Empty());
  EXPECT_EQ(dir.Lookup("f0:18:98:aa:bb:cc"), "Apple, Inc.");
}
