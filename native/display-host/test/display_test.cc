#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "display.h"
#include "fakes.h"

namespace display_host {
namespace {

using fakes::FakeRenderEngine;
using fakes::FakeWindowHost;
using fakes::ManualScheduler;
using fakes::MemorySettingsStore;

class DisplayTest : public ::testing::Test {
 protected:
  DisplayTest() : video(engine, settings) {
    host.clock = [this]() { return scheduler.now(); };
  }

  std::unique_ptr<Display> MakeDisplay(const std::string& name = "preview", const DisplayOptions& options = {}) {
    lastError = DisplayError::kNone;
    return Display::Create(name, options, video, host, host, selection, scheduler, DisplayTiming{}, &lastError);
  }

  FakeRenderEngine engine;
  MemorySettingsStore settings;
  VideoService video;
  FakeWindowHost host;
  SelectionState selection;
  ManualScheduler scheduler;
  DisplayError lastError = DisplayError::kNone;
};

// Element rect provider returning whatever `rect` holds at call time.
ElementRectProvider Provide(const std::shared_ptr<ClientRect>& rect) {
  return [rect](ClientRect* out) {
    *out = *rect;
    return true;
  };
}

TEST_F(DisplayTest, CreateAllocatesSurfaceOnCurrentWindow) {
  auto display = MakeDisplay();
  ASSERT_TRUE(display != nullptr);
  EXPECT_EQ(lastError, DisplayError::kNone);
  EXPECT_TRUE(display->isInteractive());
  EXPECT_EQ(display->electronWindowId(), 1);

  ASSERT_EQ(engine.calls.size(), 2u);
  EXPECT_EQ(engine.calls[0], "createDisplay preview 0");
  EXPECT_EQ(engine.calls[1], "setPaddingColor preview 11 22 28");
  ASSERT_FALSE(engine.lastWindow.empty());
  EXPECT_EQ(engine.lastWindow[0], 1);

  // close, focus, blur, moved and the document pointer-down.
  EXPECT_EQ(host.listeners.Size(), 5u);
  EXPECT_EQ(selection.SubscriberCount(), 1u);
}

TEST_F(DisplayTest, SourceIdCreatesSourcePreview) {
  DisplayOptions options;
  options.sourceId = "camera_1";
  options.renderingMode = RenderingMode::kStreaming;
  auto display = MakeDisplay("source-preview", options);
  ASSERT_TRUE(display != nullptr);
  EXPECT_EQ(engine.Count("createDisplay"), 0u);
  ASSERT_EQ(engine.CallsTo("createSourcePreviewDisplay").size(), 1u);
  EXPECT_EQ(engine.CallsTo("createSourcePreviewDisplay")[0], "createSourcePreviewDisplay source-preview camera_1");
}

TEST_F(DisplayTest, RenderingModeIsForwarded) {
  DisplayOptions options;
  options.renderingMode = RenderingMode::kRecording;
  auto display = MakeDisplay("rec", options);
  ASSERT_TRUE(display != nullptr);
  EXPECT_EQ(engine.calls[0], "createDisplay rec 2");
}

TEST_F(DisplayTest, PaddingOptionsAreApplied) {
  DisplayOptions options;
  options.paddingColor = Color{1, 2, 3};
  options.paddingSize = 5;
  auto display = MakeDisplay("padded", options);
  ASSERT_TRUE(display != nullptr);
  EXPECT_EQ(engine.CallsTo("setPaddingColor"), std::vector<std::string>{"setPaddingColor padded 1 2 3"});
  EXPECT_EQ(engine.CallsTo("setPaddingSize"), std::vector<std::string>{"setPaddingSize padded 5"});
}

TEST_F(DisplayTest, UnknownWindowGivesNonInteractiveDisplay) {
  DisplayOptions options;
  options.electronWindowId = 42;
  auto display = MakeDisplay("orphan", options);
  ASSERT_TRUE(display != nullptr);
  EXPECT_EQ(lastError, DisplayError::kWindowNotFound);
  EXPECT_FALSE(display->isInteractive());
  EXPECT_TRUE(engine.calls.empty());
  EXPECT_EQ(host.listeners.Size(), 0u);

  EXPECT_EQ(display->Move(3, 4), DisplayError::kNone);
  EXPECT_EQ(display->Resize(30, 40), DisplayError::kNone);
  EXPECT_EQ(display->currentPosition(), (Rect{3, 4, 30, 40}));
  EXPECT_TRUE(engine.calls.empty());

  display->Destroy();
  EXPECT_EQ(engine.Count("destroyDisplay"), 0u);
}

TEST_F(DisplayTest, EngineCreateFailureReturnsNothing) {
  engine.Fail("createDisplay");
  auto display = MakeDisplay();
  EXPECT_TRUE(display == nullptr);
  EXPECT_EQ(lastError, DisplayError::kEngineCallFailed);
  EXPECT_EQ(engine.Count("destroyDisplay"), 0u);
  EXPECT_EQ(host.listeners.Size(), 0u);
  EXPECT_EQ(selection.SubscriberCount(), 0u);
}

TEST_F(DisplayTest, DestroyTwiceReleasesSurfaceOnce) {
  auto display = MakeDisplay();
  display->Destroy();
  display->Destroy();
  EXPECT_EQ(engine.Count("destroyDisplay"), 1u);
  EXPECT_TRUE(display->isClosed());
  EXPECT_EQ(host.listeners.Size(), 0u);
  EXPECT_EQ(selection.SubscriberCount(), 0u);
}

TEST_F(DisplayTest, WindowCloseThenDestroyReleasesSurfaceOnce) {
  auto display = MakeDisplay();
  EXPECT_EQ(host.Emit(1, WindowEvent::kClose), 1u);
  EXPECT_EQ(engine.Count("destroyDisplay"), 1u);
  // Close leaves window listeners in place; only destroy removes them.
  EXPECT_EQ(host.listeners.Size(), 5u);

  host.Emit(1, WindowEvent::kClose);
  display->Destroy();
  EXPECT_EQ(engine.Count("destroyDisplay"), 1u);
  EXPECT_EQ(host.listeners.Size(), 0u);
}

TEST_F(DisplayTest, DestructionReleasesEverything) {
  {
    auto display = MakeDisplay();
    display->TrackElement(Provide(std::make_shared<ClientRect>()));
    EXPECT_EQ(scheduler.pending(), 1u);
  }
  EXPECT_EQ(engine.Count("destroyDisplay"), 1u);
  EXPECT_EQ(host.listeners.Size(), 0u);
  EXPECT_EQ(selection.SubscriberCount(), 0u);
  EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(DisplayTest, WindowMovesAreDebounced) {
  auto display = MakeDisplay();
  host.Emit(1, WindowEvent::kMoved);
  scheduler.AdvanceBy(100);
  host.Emit(1, WindowEvent::kMoved);
  scheduler.AdvanceBy(100);
  host.Emit(1, WindowEvent::kMoved);

  scheduler.AdvanceBy(499);
  ASSERT_EQ(host.styleBlockerUpdates.size(), 1u);
  EXPECT_EQ(host.styleBlockerUpdates[0], std::make_pair(uint64_t{0}, true));

  scheduler.AdvanceBy(1);
  ASSERT_EQ(host.styleBlockerUpdates.size(), 2u);
  EXPECT_EQ(host.styleBlockerUpdates[1], std::make_pair(uint64_t{700}, false));

  scheduler.AdvanceBy(2000);
  EXPECT_EQ(host.styleBlockerUpdates.size(), 2u);
}

TEST_F(DisplayTest, MoveDuringTitleBarDragIsIgnored) {
  auto display = MakeDisplay();
  host.moveInProgress = true;
  host.Emit(1, WindowEvent::kMoved);
  scheduler.AdvanceBy(1000);
  EXPECT_TRUE(host.styleBlockerUpdates.empty());
}

TEST_F(DisplayTest, CloseCancelsPendingStyleBlockerTimeout) {
  auto display = MakeDisplay();
  host.Emit(1, WindowEvent::kMoved);
  display->Close();
  scheduler.AdvanceBy(1000);
  EXPECT_EQ(host.styleBlockerUpdates.size(), 1u);
}

TEST_F(DisplayTest, FocusEventsAreForwarded) {
  auto display = MakeDisplay();
  host.Emit(1, WindowEvent::kFocus);
  host.Emit(1, WindowEvent::kBlur);
  host.EmitPointerDown();
  EXPECT_EQ(engine.CallsTo("setFocused"),
            (std::vector<std::string>{"setFocused preview true", "setFocused preview false",
                                      "setFocused preview true"}));
}

TEST_F(DisplayTest, EventsForOtherWindowsAreNotDelivered) {
  host.windows[2] = Rect{0, 0, 100, 100};
  auto display = MakeDisplay();
  EXPECT_EQ(host.Emit(2, WindowEvent::kClose), 0u);
  EXPECT_FALSE(display->isClosed());
}

TEST_F(DisplayTest, TrackingSkipsUnchangedRectangle) {
  host.windows[1] = Rect{0, 0, 800, 600};
  auto rect = std::make_shared<ClientRect>(ClientRect{10, 10, 110, 110, 100, 100});
  auto display = MakeDisplay();
  ASSERT_EQ(display->TrackElement(Provide(rect)), DisplayError::kNone);

  EXPECT_EQ(engine.CallsTo("moveDisplay"), std::vector<std::string>{"moveDisplay preview 10 110"});
  EXPECT_EQ(engine.CallsTo("resizeDisplay"), std::vector<std::string>{"resizeDisplay preview 100 100"});

  scheduler.AdvanceBy(500);
  scheduler.AdvanceBy(500);
  EXPECT_EQ(engine.Count("moveDisplay"), 1u);
  EXPECT_EQ(engine.Count("resizeDisplay"), 1u);
  EXPECT_EQ(engine.Count("setDisplayScale"), 1u);

  rect->left = 20;
  scheduler.AdvanceBy(500);
  EXPECT_EQ(engine.Count("moveDisplay"), 2u);
  EXPECT_EQ(engine.CallsTo("moveDisplay")[1], "moveDisplay preview 20 110");
}

TEST_F(DisplayTest, TrackingTranslatesByWindowBoundsAndSetsScale) {
  host.scaleFactor = 2.0;
  auto rect = std::make_shared<ClientRect>(ClientRect{10.4, 5, 210.4, 155, 200, 150});
  auto display = MakeDisplay();
  display->TrackElement(Provide(rect));
  EXPECT_EQ(engine.CallsTo("setDisplayScale"), std::vector<std::string>{"setDisplayScale preview 2"});
  EXPECT_EQ(display->currentPosition(), (Rect{110, 205, 200, 150}));
}

TEST_F(DisplayTest, TrackingReplacesPreviousLoop) {
  auto display = MakeDisplay();
  display->TrackElement(Provide(std::make_shared<ClientRect>()));
  display->TrackElement(Provide(std::make_shared<ClientRect>()));
  EXPECT_EQ(scheduler.pending(), 1u);
  EXPECT_TRUE(display->isTracking());
  display->StopTracking();
  EXPECT_EQ(scheduler.pending(), 0u);
  EXPECT_FALSE(display->isTracking());
}

TEST_F(DisplayTest, TrackingSkipsWhenElementIsGone) {
  auto display = MakeDisplay();
  display->TrackElement([](ClientRect*) { return false; });
  scheduler.AdvanceBy(1500);
  EXPECT_EQ(engine.Count("moveDisplay"), 0u);
  EXPECT_EQ(engine.Count("resizeDisplay"), 0u);
}

TEST_F(DisplayTest, ProviderThatClosesTheDisplayEndsTheStep) {
  auto display = MakeDisplay();
  Display* raw = display.get();
  auto seen = std::make_shared<std::vector<std::string>>();
  const std::string label(64, 'x');
  const DisplayError status = raw->TrackElement([raw, label, seen](ClientRect* rect) {
    raw->Close();
    raw->Destroy();
    // The closure must survive its own display being closed.
    seen->push_back(label);
    *rect = ClientRect{1, 2, 3, 4, 5, 6};
    return true;
  });

  EXPECT_EQ(status, DisplayError::kAlreadyDestroyed);
  ASSERT_EQ(seen->size(), 1u);
  EXPECT_EQ((*seen)[0], label);
  EXPECT_EQ(engine.Count("setDisplayScale"), 0u);
  EXPECT_EQ(engine.Count("moveDisplay"), 0u);
  EXPECT_EQ(engine.Count("destroyDisplay"), 1u);
  EXPECT_FALSE(display->isTracking());
  EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(DisplayTest, ProviderClosingFromPollingLoopStopsIt) {
  auto display = MakeDisplay();
  Display* raw = display.get();
  int calls = 0;
  ASSERT_EQ(raw->TrackElement([raw, &calls](ClientRect* rect) {
    calls += 1;
    if (calls == 2) {
      raw->Close();
    }
    *rect = ClientRect{0, 0, 10, 10, 10, 10};
    return true;
  }),
            DisplayError::kNone);

  scheduler.AdvanceBy(500);
  scheduler.AdvanceBy(1500);
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(engine.Count("moveDisplay"), 1u);
  EXPECT_EQ(scheduler.pending(), 0u);
}

TEST(ResolveTimingMsTest, ClampsBeforeConverting) {
  EXPECT_EQ(ResolveTimingMs(250.7, 500, 16), 250u);
  EXPECT_EQ(ResolveTimingMs(1e30, 500, 16), kMaxTimingMs);
  EXPECT_EQ(ResolveTimingMs(60001.0, 500, 0), kMaxTimingMs);
  EXPECT_EQ(ResolveTimingMs(5.0, 500, 16), 500u);
  EXPECT_EQ(ResolveTimingMs(-1.0, 500, 0), 500u);
  EXPECT_EQ(ResolveTimingMs(std::nan(""), 500, 0), 500u);
  EXPECT_EQ(ResolveTimingMs(0.0, 500, 0), 0u);
}

TEST_F(DisplayTest, CloseStopsTracking) {
  auto rect = std::make_shared<ClientRect>(ClientRect{0, 0, 50, 50, 50, 50});
  auto display = MakeDisplay();
  display->TrackElement(Provide(rect));
  display->Close();
  EXPECT_EQ(scheduler.pending(), 0u);
  rect->left = 99;
  scheduler.AdvanceBy(2000);
  EXPECT_EQ(engine.Count("moveDisplay"), 1u);
  EXPECT_EQ(display->TrackElement(Provide(rect)), DisplayError::kAlreadyDestroyed);
}

TEST_F(DisplayTest, OutputRegionFansOutToEveryObserver) {
  auto display = MakeDisplay();
  std::vector<Rect> first;
  std::vector<Rect> second;
  display->OnOutputResize([&first](const Rect& region) { first.push_back(region); });
  display->OnOutputResize([&second](const Rect& region) { second.push_back(region); });

  ASSERT_EQ(display->Resize(800, 450), DisplayError::kNone);
  const Rect expected{4, 8, 640, 360};
  ASSERT_EQ(first.size(), 1u);
  ASSERT_EQ(second.size(), 1u);
  EXPECT_EQ(first[0], expected);
  EXPECT_EQ(second[0], expected);
  EXPECT_EQ(display->outputRegion(), expected);
}

TEST_F(DisplayTest, ResizeWithoutObserversSkipsRegionQuery) {
  auto display = MakeDisplay();
  display->Resize(800, 450);
  EXPECT_EQ(engine.Count("getPreviewOffset"), 0u);
  EXPECT_EQ(engine.Count("getPreviewSize"), 0u);
}

TEST_F(DisplayTest, FailedRegionQueryDoesNotNotify) {
  auto display = MakeDisplay();
  int notified = 0;
  display->OnOutputResize([&notified](const Rect&) { notified += 1; });
  engine.Fail("getPreviewSize");
  EXPECT_EQ(display->Resize(800, 450), DisplayError::kEngineCallFailed);
  EXPECT_EQ(notified, 0);
}

TEST_F(DisplayTest, CloseDropsObservers) {
  auto display = MakeDisplay();
  display->OnOutputResize([](const Rect&) {});
  display->Close();
  EXPECT_EQ(display->outputObserverCount(), 0u);
}

TEST_F(DisplayTest, GuideLinesFollowSelectionSize) {
  selection.Update({"a", "b"});
  auto display = MakeDisplay();
  EXPECT_EQ(engine.CallsTo("setDrawGuideLines"), std::vector<std::string>{"setDrawGuideLines preview false"});

  selection.Update({"a"});
  ASSERT_EQ(engine.Count("setDrawGuideLines"), 2u);
  EXPECT_EQ(engine.CallsTo("setDrawGuideLines")[1], "setDrawGuideLines preview true");
}

TEST_F(DisplayTest, SingleSelectionLeavesGuideLinesAlone) {
  selection.Update({"a"});
  auto display = MakeDisplay();
  EXPECT_EQ(engine.Count("setDrawGuideLines"), 0u);
}

TEST_F(DisplayTest, GuideLinesIgnoredWhileNotDrawingUI) {
  auto display = MakeDisplay();
  ASSERT_EQ(display->SetShouldDrawUI(false), DisplayError::kNone);
  EXPECT_EQ(engine.CallsTo("setShouldDrawUI"), std::vector<std::string>{"setShouldDrawUI preview false"});
  selection.Update({"a", "b", "c"});
  EXPECT_EQ(engine.Count("setDrawGuideLines"), 0u);

  display->SetShouldDrawUI(true);
  selection.Update({});
  EXPECT_EQ(engine.CallsTo("setDrawGuideLines"), std::vector<std::string>{"setDrawGuideLines preview true"});
}

TEST_F(DisplayTest, SelectionChangesAfterCloseAreIgnored) {
  auto display = MakeDisplay();
  display->Close();
  selection.Update({"a", "b"});
  EXPECT_EQ(engine.Count("setDrawGuideLines"), 0u);
}

TEST_F(DisplayTest, EngineFailuresAreReported) {
  auto display = MakeDisplay();
  engine.Fail("moveDisplay");
  engine.Fail("setFocused");
  EXPECT_EQ(display->Move(1, 2), DisplayError::kEngineCallFailed);
  EXPECT_EQ(display->currentPosition().x, 1);
  EXPECT_EQ(display->SetFocused(true), DisplayError::kEngineCallFailed);
}

TEST_F(DisplayTest, OperationsAfterCloseReportAlreadyDestroyed) {
  auto display = MakeDisplay();
  display->Close();
  const size_t callsAtClose = engine.calls.size();
  EXPECT_EQ(display->Move(1, 2), DisplayError::kAlreadyDestroyed);
  EXPECT_EQ(display->Resize(1, 2), DisplayError::kAlreadyDestroyed);
  EXPECT_EQ(display->SetFocused(true), DisplayError::kAlreadyDestroyed);
  EXPECT_EQ(display->RefreshOutputRegion(), DisplayError::kAlreadyDestroyed);
  EXPECT_EQ(engine.calls.size(), callsAtClose);
}

}  // namespace
}  // namespace display_host
