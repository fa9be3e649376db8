#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "display_registry.h"
#include "fakes.h"

namespace display_host {
namespace {

using fakes::FakeRenderEngine;
using fakes::FakeWindowHost;
using fakes::ManualScheduler;
using fakes::MemorySettingsStore;

class DisplayRegistryTest : public ::testing::Test {
 protected:
  DisplayRegistryTest() : video(engine, settings), registry(scheduler) {}

  std::unique_ptr<Display> MakeDisplay(const std::string& name) {
    DisplayError error = DisplayError::kNone;
    return Display::Create(name, DisplayOptions{}, video, host, host, selection, scheduler, DisplayTiming{}, &error);
  }

  FakeRenderEngine engine;
  MemorySettingsStore settings;
  VideoService video;
  FakeWindowHost host;
  SelectionState selection;
  ManualScheduler scheduler;
  DisplayRegistry registry;
};

TEST_F(DisplayRegistryTest, FindsDisplaysByName) {
  ASSERT_TRUE(registry.Add(MakeDisplay("a")));
  ASSERT_TRUE(registry.Add(MakeDisplay("b")));
  EXPECT_TRUE(registry.Contains("a"));
  ASSERT_TRUE(registry.Find("b") != nullptr);
  EXPECT_EQ(registry.Find("b")->name(), "b");
  EXPECT_TRUE(registry.Find("c") == nullptr);
  EXPECT_EQ(registry.displays().size(), 2u);
}

TEST_F(DisplayRegistryTest, RejectsTakenNames) {
  ASSERT_TRUE(registry.Add(MakeDisplay("a")));
  EXPECT_FALSE(registry.Add(MakeDisplay("a")));
  EXPECT_FALSE(registry.Add(nullptr));
  EXPECT_EQ(registry.displays().size(), 1u);
}

TEST_F(DisplayRegistryTest, RemoveDestroysNowAndFreesLater) {
  ASSERT_TRUE(registry.Add(MakeDisplay("a")));
  EXPECT_TRUE(registry.Remove("a"));
  EXPECT_FALSE(registry.Contains("a"));
  EXPECT_EQ(engine.Count("destroyDisplay"), 1u);
  EXPECT_EQ(host.listeners.Size(), 0u);
  EXPECT_EQ(registry.retiredCount(), 1u);

  scheduler.AdvanceBy(0);
  EXPECT_EQ(registry.retiredCount(), 0u);
  EXPECT_EQ(engine.Count("destroyDisplay"), 1u);
  EXPECT_FALSE(registry.Remove("a"));
}

TEST_F(DisplayRegistryTest, DisplayRemovedByItsOwnProviderStaysValid) {
  ASSERT_TRUE(registry.Add(MakeDisplay("a")));
  Display* raw = registry.Find("a");
  const std::string label(64, 'y');
  std::string seen;
  const DisplayError status = raw->TrackElement([this, label, &seen](ClientRect* rect) {
    registry.Remove("a");
    seen = label;
    *rect = ClientRect{0, 0, 10, 10, 10, 10};
    return true;
  });

  EXPECT_EQ(status, DisplayError::kAlreadyDestroyed);
  EXPECT_EQ(seen, label);
  EXPECT_TRUE(raw->isClosed());
  EXPECT_FALSE(raw->isTracking());
  EXPECT_EQ(engine.Count("moveDisplay"), 0u);
  EXPECT_EQ(engine.Count("destroyDisplay"), 1u);

  scheduler.AdvanceBy(0);
  EXPECT_EQ(registry.retiredCount(), 0u);
  EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(DisplayRegistryTest, SeveralRemovalsShareOneSweep) {
  ASSERT_TRUE(registry.Add(MakeDisplay("a")));
  ASSERT_TRUE(registry.Add(MakeDisplay("b")));
  registry.Remove("a");
  registry.Remove("b");
  EXPECT_EQ(scheduler.pending(), 1u);
  EXPECT_EQ(registry.retiredCount(), 2u);
  scheduler.AdvanceBy(0);
  EXPECT_EQ(registry.retiredCount(), 0u);
}

TEST_F(DisplayRegistryTest, ClearReleasesEverything) {
  ASSERT_TRUE(registry.Add(MakeDisplay("a")));
  ASSERT_TRUE(registry.Add(MakeDisplay("b")));
  registry.Remove("a");
  registry.Clear();
  EXPECT_EQ(engine.Count("destroyDisplay"), 2u);
  EXPECT_EQ(registry.retiredCount(), 0u);
  EXPECT_TRUE(registry.displays().empty());
  EXPECT_EQ(scheduler.pending(), 0u);
}

}  // namespace
}  // namespace display_host
