#include "FakePlatform.hpp"

#include "chrome/DragRegionComputer.hpp"
#include "chrome/DragRegionController.hpp"

#include <chrono>
#include <vector>

#include <doctest/doctest.h>

using namespace fk::chrome;
using namespace std::chrono_literals;
using fk::test::ClockedScheduler;
using fk::test::FakeElement;
using fk::test::FakeWindow;

namespace
{
SizeInt const kClient{800, 600};

std::vector<RectInt> passthrough_of(Region const &region)
{
    return region.rects(RegionKind::Passthrough);
}

struct ControllerFixture
{
    ClockedScheduler time;
    FakeWindow window{0x10, {0, 0, 800, 600}};
    WindowMetrics metrics;
    DragRegionController controller{window, metrics, time.scheduler, 125ms};
    FakeElement root{ElementCategory::Panel, {}, {800.0, 600.0}};

    ControllerFixture()
    {
        root.add(ElementCategory::SelectableGrid, {0.0, 100.0},
                 {800.0, 400.0});
    }

    bool caption_installed()
    {
        return !window.rects(RegionKind::Caption).empty();
    }
};
} // namespace

TEST_CASE("classify maps element categories to region roles")
{
    struct Row
    {
        ElementCategory category;
        RegionRole role;
    };
    Row const rows[] = {
        {ElementCategory::Panel, RegionRole::TransparentContainer},
        {ElementCategory::SelectableGrid, RegionRole::PassthroughClaim},
        {ElementCategory::MenuBar, RegionRole::PassthroughClaim},
        {ElementCategory::Expander, RegionRole::PassthroughClaim},
        {ElementCategory::CommandBar, RegionRole::PassthroughClaim},
        {ElementCategory::ScrollBar, RegionRole::PassthroughClaim},
        {ElementCategory::TextBlock, RegionRole::CaptionClaim},
        {ElementCategory::ScrollViewer, RegionRole::TransparentContainer},
        {ElementCategory::TabView, RegionRole::TabStrip},
        {ElementCategory::Other, RegionRole::TransparentContainer},
    };
    for (auto const &row : rows)
    {
        FakeElement element(row.category);
        CHECK(classify(element) == row.role);
    }

    FakeElement link(ElementCategory::TextBlock);
    link.hyperlink_ = true;
    CHECK(classify(link) == RegionRole::PassthroughClaim);

    FakeElement scroller(ElementCategory::ScrollViewer);
    scroller.scroll_bar_visible_ = true;
    CHECK(classify(scroller) == RegionRole::PassthroughClaim);
}

TEST_CASE("an empty tree leaves the whole client area draggable")
{
    FakeElement root(ElementCategory::Panel);
    auto region = DragRegionComputer{}.recompute(root, kClient, 1.0);
    CHECK(region.empty(RegionKind::Passthrough));
    REQUIRE(region.rects(RegionKind::Caption).size() == 1);
    CHECK(region.rects(RegionKind::Caption).front() == RectInt{0, 0, 800, 600});
}

TEST_CASE("interactive controls become scaled passthrough rectangles")
{
    FakeElement root(ElementCategory::Panel);
    auto &panel = root.add(ElementCategory::Panel, {}, {});
    panel.add(ElementCategory::SelectableGrid, {10.0, 50.0}, {200.0, 100.0});

    auto region = DragRegionComputer{}.recompute(root, {1200, 900}, 1.5);
    REQUIRE(passthrough_of(region).size() == 1);
    CHECK(passthrough_of(region).front() == RectInt{15, 75, 300, 150});
    for (auto const &caption : region.rects(RegionKind::Caption))
    {
        CHECK_FALSE(caption.intersects({15, 75, 300, 150}));
    }
}

TEST_CASE("claims stop the walk below them")
{
    FakeElement root(ElementCategory::Panel);

    auto &text = root.add(ElementCategory::TextBlock, {0.0, 0.0},
                          {100.0, 20.0});
    text.add(ElementCategory::SelectableGrid, {0.0, 0.0}, {50.0, 10.0});

    auto &grid = root.add(ElementCategory::SelectableGrid, {0.0, 100.0},
                          {100.0, 100.0});
    grid.add(ElementCategory::ScrollBar, {90.0, 100.0}, {10.0, 100.0});

    auto region = DragRegionComputer{}.recompute(root, kClient, 1.0);
    REQUIRE(passthrough_of(region).size() == 1);
    CHECK(passthrough_of(region).front() == RectInt{0, 100, 100, 100});
}

TEST_CASE("scroll viewers only claim input while their scroll bar shows")
{
    FakeElement root(ElementCategory::Panel);
    auto &viewer = root.add(ElementCategory::ScrollViewer, {0.0, 0.0},
                            {400.0, 300.0});
    viewer.add(ElementCategory::Expander, {0.0, 10.0}, {400.0, 30.0});

    auto hidden = DragRegionComputer{}.recompute(root, kClient, 1.0);
    REQUIRE(passthrough_of(hidden).size() == 1);
    CHECK(passthrough_of(hidden).front() == RectInt{0, 10, 400, 30});

    viewer.scroll_bar_visible_ = true;
    auto shown = DragRegionComputer{}.recompute(root, kClient, 1.0);
    REQUIRE(passthrough_of(shown).size() == 1);
    CHECK(passthrough_of(shown).front() == RectInt{0, 0, 400, 300});
}

TEST_CASE("a detached child ends the walk of its siblings")
{
    FakeElement root(ElementCategory::Panel);
    root.add(ElementCategory::SelectableGrid, {0.0, 0.0}, {100.0, 50.0});
    auto &gone = root.add(ElementCategory::SelectableGrid, {0.0, 60.0},
                          {100.0, 50.0});
    gone.attached_ = false;
    root.add(ElementCategory::SelectableGrid, {0.0, 120.0}, {100.0, 50.0});

    auto region = DragRegionComputer{}.recompute(root, kClient, 1.0);
    REQUIRE(passthrough_of(region).size() == 1);
    CHECK(passthrough_of(region).front() == RectInt{0, 0, 100, 50});
}

TEST_CASE("tab views claim the tab strip and walk the selected tab only")
{
    FakeElement header(ElementCategory::Other, {0.0, 0.0}, {100.0, 32.0});
    FakeElement footer(ElementCategory::Other, {400.0, 0.0}, {60.0, 32.0});

    FakeElement root(ElementCategory::Panel);
    auto &tabs = root.add(ElementCategory::TabView, {0.0, 0.0},
                          {800.0, 600.0});
    TabStripParts parts;
    parts.header = &header;
    parts.header_margin = {4.0, 0.0, 8.0, 0.0};
    parts.footer = &footer;
    parts.padding_top = 2.0;
    tabs.tab_strip_ = parts;

    auto &selected = tabs.add(ElementCategory::TabViewItem, {}, {});
    selected.add(ElementCategory::SelectableGrid, {0.0, 40.0},
                 {800.0, 500.0});
    auto &hidden = tabs.add(ElementCategory::TabViewItem, {}, {});
    hidden.add(ElementCategory::CommandBar, {0.0, 560.0}, {800.0, 40.0});
    tabs.selected_tab_ = &selected;

    auto region = DragRegionComputer{}.recompute(root, kClient, 1.0);
    auto const passthrough = passthrough_of(region);
    REQUIRE(passthrough.size() == 2);
    CHECK(passthrough[0] == RectInt{112, 2, 288, 32});
    CHECK(passthrough[1] == RectInt{0, 40, 800, 500});
}

TEST_CASE("a tree closing under the walk throws TreeClosedError")
{
    FakeElement root(ElementCategory::Panel);
    root.closed_ = true;
    CHECK_THROWS_AS(DragRegionComputer{}.recompute(root, kClient, 1.0),
                    TreeClosedError);
}

TEST_CASE_FIXTURE(ControllerFixture, "layout changes install regions after the quiet interval")
{
    controller.add_drag_region_event_handlers(root);
    root.raise(UiEvent::SizeChanged);
    CHECK(controller.recompute_pending());

    time.run_for(124ms);
    CHECK_FALSE(caption_installed());

    time.run_for(1ms);
    CHECK(caption_installed());
    CHECK_FALSE(controller.recompute_pending());
    REQUIRE(window.rects(RegionKind::Passthrough).size() == 1);
    CHECK(window.rects(RegionKind::Passthrough).front() ==
          RectInt{0, 100, 800, 400});
    CHECK(controller.current_region() == controller.compute());
}

TEST_CASE_FIXTURE(ControllerFixture, "requests inside the interval coalesce")
{
    controller.set_content(&root);
    int const before = static_cast<int>(time.scheduler.pending());

    controller.set_window_drag_regions();
    time.run_for(100ms);
    controller.set_window_drag_regions();
    CHECK(time.scheduler.pending() == static_cast<size_t>(before + 1));

    time.run_for(100ms);
    CHECK_FALSE(caption_installed());
    time.run_for(25ms);
    CHECK(caption_installed());
}

TEST_CASE_FIXTURE(ControllerFixture, "open overlays make the whole window passthrough")
{
    controller.set_content(&root);
    controller.apply_now();
    REQUIRE(caption_installed());

    controller.set_window_drag_regions();
    controller.overlay_opened();
    CHECK_FALSE(caption_installed());
    CHECK(controller.overlay_open());

    auto const region = controller.compute();
    CHECK(region.empty(RegionKind::Caption));
    REQUIRE(passthrough_of(region).size() == 1);
    CHECK(passthrough_of(region).front() == RectInt{0, 0, 800, 600});
    CHECK(controller.current_region() == region);

    // the request queued before the overlay opened must not reinstate it
    time.run_for(300ms);
    CHECK_FALSE(caption_installed());

    SUBCASE("caption returns within one interval of the last close")
    {
        controller.overlay_opened();
        controller.overlay_closed();
        CHECK_FALSE(controller.recompute_pending());
        time.run_for(300ms);
        CHECK_FALSE(caption_installed());

        controller.overlay_closed();
        CHECK(controller.recompute_pending());
        time.run_for(125ms);
        CHECK(caption_installed());
        CHECK_FALSE(controller.overlay_open());
    }
    SUBCASE("unbalanced closes do not underflow")
    {
        controller.overlay_closed();
        controller.overlay_closed();
        CHECK_FALSE(controller.overlay_open());
        controller.overlay_opened();
        CHECK(controller.overlay_open());
    }
}

TEST_CASE_FIXTURE(ControllerFixture, "a request after an explicit clear restores the caption")
{
    controller.set_content(&root);
    controller.apply_now();
    REQUIRE(caption_installed());

    controller.clear_window_drag_regions();
    CHECK_FALSE(caption_installed());

    controller.set_window_drag_regions();
    CHECK(controller.recompute_pending());
    time.run_for(124ms);
    CHECK_FALSE(caption_installed());
    time.run_for(1ms);
    CHECK(caption_installed());
    REQUIRE(window.rects(RegionKind::Passthrough).size() == 1);
    CHECK(window.rects(RegionKind::Passthrough).front() ==
          RectInt{0, 100, 800, 400});

    SUBCASE("a request queued before the clear stays dropped")
    {
        controller.set_window_drag_regions();
        controller.clear_window_drag_regions();
        time.run_for(300ms);
        CHECK_FALSE(caption_installed());

        controller.set_window_drag_regions();
        time.run_for(125ms);
        CHECK(caption_installed());
    }
    SUBCASE("requests while an overlay is open wait for its close")
    {
        controller.overlay_opened();
        controller.set_window_drag_regions();
        CHECK_FALSE(controller.recompute_pending());
        time.run_for(300ms);
        CHECK_FALSE(caption_installed());

        controller.overlay_closed();
        time.run_for(125ms);
        CHECK(caption_installed());
    }
}

TEST_CASE_FIXTURE(ControllerFixture, "recompute against a closing tree is a no-op")
{
    controller.set_content(&root);
    controller.apply_now();
    auto const installed = window.rects(RegionKind::Caption);
    REQUIRE_FALSE(installed.empty());

    root.closed_ = true;
    CHECK_NOTHROW(controller.apply_now());
    CHECK(window.rects(RegionKind::Caption) == installed);

    controller.set_window_drag_regions();
    CHECK_NOTHROW(time.run_for(200ms));
}

TEST_CASE_FIXTURE(ControllerFixture, "nothing is installed without region support or loaded content")
{
    controller.set_content(&root);

    SUBCASE("no region customisation")
    {
        window.supports_regions_ = false;
        controller.apply_now();
        CHECK_FALSE(caption_installed());
    }
    SUBCASE("content not loaded")
    {
        root.loaded_ = false;
        controller.apply_now();
        CHECK_FALSE(caption_installed());
    }
}

TEST_CASE_FIXTURE(ControllerFixture, "event handlers follow layout and overlay lifecycles")
{
    auto &menu_bar = root.add(ElementCategory::MenuBar, {0.0, 0.0},
                              {300.0, 32.0});
    FakeElement first_item(ElementCategory::Other);
    auto &menu_item = menu_bar.add(ElementCategory::MenuBarItem, {}, {});
    menu_item.first_menu_item_ = &first_item;
    auto &expander = root.add(ElementCategory::Expander, {0.0, 520.0},
                              {800.0, 40.0});
    auto &picker = root.add(ElementCategory::OverlayOwner, {}, {});
    root.context_overlay_ = true;

    controller.add_drag_region_event_handlers(root);

    CHECK(menu_bar.subscriptions(UiEvent::SizeChanged) == 1);
    CHECK(menu_bar.subscriptions(UiEvent::Loaded) == 1);
    CHECK(expander.subscriptions(UiEvent::SizeChanged) == 1);
    CHECK(root.owned_.front()->subscriptions(UiEvent::SizeChanged) == 1);

    SUBCASE("menu drop down")
    {
        first_item.raise(UiEvent::Loaded);
        CHECK(controller.overlay_open());
        first_item.raise(UiEvent::Unloaded);
        CHECK_FALSE(controller.overlay_open());
        CHECK(controller.recompute_pending());
    }
    SUBCASE("control owned overlay")
    {
        picker.raise(UiEvent::OverlayOpened);
        CHECK(controller.overlay_open());
        picker.raise(UiEvent::OverlayClosed);
        CHECK_FALSE(controller.overlay_open());
    }
    SUBCASE("context menu")
    {
        root.raise(UiEvent::OverlayOpened);
        CHECK(controller.overlay_open());
        root.raise(UiEvent::OverlayClosed);
        CHECK_FALSE(controller.overlay_open());
    }
    SUBCASE("expander resize")
    {
        expander.raise(UiEvent::SizeChanged);
        CHECK(controller.recompute_pending());
        time.run_for(125ms);
        CHECK(caption_installed());
    }
}
