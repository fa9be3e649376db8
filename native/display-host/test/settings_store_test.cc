#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "settings_store.h"

namespace display_host {
namespace {

class IniSettingsStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
    path = ::testing::TempDir() + "display_host_" + info->name() + ".ini";
    std::remove(path.c_str());
  }

  void TearDown() override {
    std::remove(path.c_str());
    std::remove((path + ".tmp").c_str());
  }

  void WriteFile(const std::string& text) {
    std::ofstream out(path, std::ios::trunc);
    out << text;
  }

  std::string path;
};

TEST_F(IniSettingsStoreTest, MissingFileLoadsEmpty) {
  IniSettingsStore store(path);
  ASSERT_TRUE(store.Load());
  std::string value;
  EXPECT_FALSE(store.GetValue("Video", "Base", &value));
}

TEST_F(IniSettingsStoreTest, ReadsExistingSections) {
  WriteFile(
      "[General]\n"
      "Name=studio\n"
      "\n"
      "[Video]\n"
      "Base=1280x720\n"
      "Output=1920x1080\n");
  IniSettingsStore store(path);
  ASSERT_TRUE(store.Load());

  std::string value;
  ASSERT_TRUE(store.GetValue("General", "Name", &value));
  EXPECT_EQ(value, "studio");
  ASSERT_TRUE(store.GetValue("Video", "Base", &value));
  EXPECT_EQ(value, "1280x720");
  ASSERT_TRUE(store.GetValue("Video", "Output", &value));
  EXPECT_EQ(value, "1920x1080");
  EXPECT_FALSE(store.GetValue("Video", "FPS", &value));
  EXPECT_FALSE(store.GetValue("Audio", "Base", &value));
}

TEST_F(IniSettingsStoreTest, SetValuePersistsAcrossReload) {
  {
    IniSettingsStore store(path);
    ASSERT_TRUE(store.Load());
    ASSERT_TRUE(store.SetValue("Video", "Base", "2560x1440"));
  }
  IniSettingsStore reloaded(path);
  ASSERT_TRUE(reloaded.Load());
  std::string value;
  ASSERT_TRUE(reloaded.GetValue("Video", "Base", &value));
  EXPECT_EQ(value, "2560x1440");
}

TEST_F(IniSettingsStoreTest, SetValueReplacesAndKeepsOtherSections) {
  WriteFile("[General]\nName=studio\n\n[Video]\nBase=1280x720\n");
  {
    IniSettingsStore store(path);
    ASSERT_TRUE(store.Load());
    ASSERT_TRUE(store.SetValue("Video", "Base", "1920x1080"));
  }
  IniSettingsStore reloaded(path);
  ASSERT_TRUE(reloaded.Load());
  std::string value;
  ASSERT_TRUE(reloaded.GetValue("Video", "Base", &value));
  EXPECT_EQ(value, "1920x1080");
  ASSERT_TRUE(reloaded.GetValue("General", "Name", &value));
  EXPECT_EQ(value, "studio");
}

TEST_F(IniSettingsStoreTest, WriteBeforeLoadFails) {
  IniSettingsStore store(path);
  EXPECT_FALSE(store.SetValue("Video", "Base", "1x1"));
  std::string value;
  EXPECT_FALSE(store.GetValue("Video", "Base", &value));
}

TEST_F(IniSettingsStoreTest, UnopenablePathFailsToLoad) {
  IniSettingsStore store(::testing::TempDir() + "no_such_dir/settings.ini");
  EXPECT_FALSE(store.Load());
  EXPECT_FALSE(store.SetValue("Video", "Base", "1x1"));
}

}  // namespace
}  // namespace display_host
