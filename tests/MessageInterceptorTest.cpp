#include "FakePlatform.hpp"

#include "chrome/MessageInterceptor.hpp"
#include "chrome/WindowChrome.hpp"

#include <memory>
#include <system_error>
#include <utility>
#include <vector>

#include <doctest/doctest.h>

using namespace fk::chrome;
using fk::test::FakeMenu;
using fk::test::FakeWindow;

namespace
{
struct Recorded
{
    std::vector<bool> shows;
    int hides = 0;
    std::vector<std::pair<bool, bool>> bounds;
    int presenter_changes = 0;

    MessageInterceptor::Handlers handlers()
    {
        return {[this](bool via_keyboard) { shows.push_back(via_keyboard); },
                [this] { ++hides; },
                [this](bool moved, bool resized) {
                    bounds.emplace_back(moved, resized);
                },
                [this] { ++presenter_changes; }};
    }
};

SizeF const kMinLogical{410.0, 480.0};
} // namespace

TEST_CASE("interceptor installs its hook and removes it on destruction")
{
    FakeWindow window;
    WindowMetrics metrics;
    Recorded recorded;
    {
        MessageInterceptor interceptor(window, metrics, kMinLogical,
                                       recorded.handlers());
        CHECK(window.hooked());
    }
    CHECK_FALSE(window.hooked());
    CHECK(window.unregister_calls_ == 1);
}

TEST_CASE("hook installation failure aborts construction")
{
    FakeWindow window;
    window.hook_error_ = std::make_error_code(std::errc::permission_denied);
    WindowMetrics metrics;
    Recorded recorded;

    CHECK_THROWS_AS(MessageInterceptor(window, metrics, kMinLogical,
                                       recorded.handlers()),
                    std::system_error);

    fk::test::ClockedScheduler time;
    auto failing = std::make_unique<FakeWindow>(0x1);
    failing->hook_error_ = std::make_error_code(std::errc::permission_denied);
    CHECK_THROWS_AS(WindowChrome(std::move(failing), time.scheduler,
                                 std::make_unique<FakeMenu>()),
                    std::system_error);
}

TEST_CASE("size constraint query reports the scaled minimum size")
{
    FakeWindow window;
    window.dpi_ = 144;
    WindowMetrics metrics;
    Recorded recorded;
    MessageInterceptor interceptor(window, metrics, kMinLogical,
                                   recorded.handlers());

    SizeInt min_track{10, 10};
    NativeMessage message;
    message.kind = MessageKind::SizeConstraintQuery;
    message.min_track_size = &min_track;
    CHECK(window.send(message) == HookResult::Unhandled);
    CHECK(min_track == SizeInt{615, 720});
    CHECK(metrics.scale_factor == doctest::Approx(1.5));
}

TEST_CASE("DPI change updates the scale and the minimum size")
{
    FakeWindow window;
    WindowMetrics metrics;
    Recorded recorded;
    MessageInterceptor interceptor(window, metrics, kMinLogical,
                                   recorded.handlers());
    CHECK(metrics.scale_factor == doctest::Approx(1.0));
    CHECK(metrics.min_track_size == SizeInt{410, 480});

    NativeMessage message;
    message.kind = MessageKind::DpiChanged;
    message.dpi = 192;
    CHECK(window.send(message) == HookResult::Unhandled);
    CHECK(metrics.scale_factor == doctest::Approx(2.0));
    CHECK(metrics.min_track_size == SizeInt{820, 960});
}

TEST_CASE("keyboard window menu request opens the replica menu")
{
    FakeWindow window;
    WindowMetrics metrics;
    Recorded recorded;
    MessageInterceptor interceptor(window, metrics, kMinLogical,
                                   recorded.handlers());

    NativeMessage message;
    message.kind = MessageKind::SystemCommand;
    message.keyboard_menu_request = true;

    SUBCASE("handled while windowed")
    {
        CHECK(window.send(message) == HookResult::Handled);
        CHECK(recorded.hides == 1);
        REQUIRE(recorded.shows.size() == 1);
        CHECK(recorded.shows.front());
    }
    SUBCASE("left alone in full screen")
    {
        window.presenter_.kind_ = PresenterKind::FullScreen;
        CHECK(window.send(message) == HookResult::Unhandled);
        CHECK(recorded.shows.empty());
    }
    SUBCASE("other system commands pass through")
    {
        message.keyboard_menu_request = false;
        CHECK(window.send(message) == HookResult::Unhandled);
        CHECK(recorded.shows.empty());
        CHECK(recorded.hides == 0);
    }
}

TEST_CASE("non client pointer messages over the caption")
{
    FakeWindow window;
    WindowMetrics metrics;
    Recorded recorded;
    MessageInterceptor interceptor(window, metrics, kMinLogical,
                                   recorded.handlers());

    NativeMessage release;
    release.kind = MessageKind::NonClientSecondaryButtonUp;
    release.hit = HitArea::Caption;
    CHECK(window.send(release) == HookResult::Handled);
    REQUIRE(recorded.shows.size() == 1);
    CHECK_FALSE(recorded.shows.front());

    release.hit = HitArea::Other;
    CHECK(window.send(release) == HookResult::Unhandled);
    CHECK(recorded.shows.size() == 1);

    NativeMessage press;
    press.kind = MessageKind::NonClientPrimaryButtonDown;
    press.hit = HitArea::Caption;
    int const hides_before = recorded.hides;
    CHECK(window.send(press) == HookResult::Unhandled);
    CHECK(recorded.hides == hides_before + 1);
}

TEST_CASE("bounds and presenter notifications are forwarded and passed on")
{
    FakeWindow window;
    WindowMetrics metrics;
    Recorded recorded;
    MessageInterceptor interceptor(window, metrics, kMinLogical,
                                   recorded.handlers());

    NativeMessage bounds;
    bounds.kind = MessageKind::BoundsChanged;
    bounds.position_changed = true;
    CHECK(window.send(bounds) == HookResult::Unhandled);
    REQUIRE(recorded.bounds.size() == 1);
    CHECK(recorded.bounds.front() == std::make_pair(true, false));

    CHECK(window.send(MessageKind::PresenterChanged) == HookResult::Unhandled);
    CHECK(recorded.presenter_changes == 1);

    CHECK(window.send(MessageKind::Other) == HookResult::Unhandled);
    CHECK(recorded.shows.empty());
    CHECK(recorded.hides == 0);
}

TEST_CASE("window chrome routes the secondary click to the menu at the cursor")
{
    fk::test::ClockedScheduler time;
    auto native = std::make_unique<FakeWindow>();
    auto menu = std::make_unique<FakeMenu>();
    FakeWindow &window = *native;
    FakeMenu &surface = *menu;
    window.dpi_ = 192;
    window.cursor_ = PointInt{300, 40};

    WindowChrome chrome(std::move(native), time.scheduler, std::move(menu));
    CHECK(chrome.scale_factor() == doctest::Approx(2.0));

    NativeMessage release;
    release.kind = MessageKind::NonClientSecondaryButtonUp;
    release.hit = HitArea::Caption;
    CHECK(window.send(release) == HookResult::Handled);
    CHECK(surface.is_open());
    CHECK(surface.position_ == PointF{150.0, 20.0});

    NativeMessage press;
    press.kind = MessageKind::NonClientPrimaryButtonDown;
    press.hit = HitArea::Caption;
    window.send(press);
    CHECK_FALSE(surface.is_open());
}
