#include "app/WindowSettingsStore.hpp"

#include "chrome/WindowStateTracker.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"
#include "utils/StateStore.hpp"

namespace fk::app
{

namespace
{
constexpr char const *kRestoreBoundsKey = "windowRestoreBounds";
constexpr char const *kWindowStateKey = "windowState";
} // namespace

std::optional<chrome::WindowState> parse_window_state(std::string_view text)
{
    if (text == "normal")
    {
        return chrome::WindowState::Normal;
    }
    if (text == "minimized")
    {
        return chrome::WindowState::Minimized;
    }
    if (text == "maximized")
    {
        return chrome::WindowState::Maximized;
    }
    return std::nullopt;
}

WindowSettingsStore::WindowSettingsStore(storage::Database *database)
  : database_(database)
{
}

bool WindowSettingsStore::usable() const noexcept
{
    return database_ != nullptr && database_->is_valid();
}

std::optional<chrome::RectInt> WindowSettingsStore::load_restore_bounds() const
{
    if (!usable())
    {
        return std::nullopt;
    }
    auto stored = database_->get_setting(kRestoreBoundsKey);
    if (!stored)
    {
        return std::nullopt;
    }

    auto const doc = json::parse(*stored);
    auto *root = json::root(doc);
    auto x = json::int_field(root, "x");
    auto y = json::int_field(root, "y");
    auto width = json::int_field(root, "width");
    auto height = json::int_field(root, "height");
    if (!x || !y || !width || !height || *width <= 0 || *height <= 0)
    {
        FK_LOG_WARN("dropping malformed {} setting", kRestoreBoundsKey);
        if (!database_->remove_setting(kRestoreBoundsKey))
        {
            FK_LOG_WARN("failed to remove {}", kRestoreBoundsKey);
        }
        return std::nullopt;
    }
    return chrome::RectInt{*x, *y, *width, *height};
}

bool WindowSettingsStore::save_restore_bounds(chrome::RectInt const &bounds)
{
    if (!usable())
    {
        return false;
    }

    auto doc = json::make_object_document();
    if (!doc)
    {
        return false;
    }
    auto *object = yyjson_mut_doc_get_root(doc.get());
    yyjson_mut_obj_add_int(doc.get(), object, "x", bounds.x);
    yyjson_mut_obj_add_int(doc.get(), object, "y", bounds.y);
    yyjson_mut_obj_add_int(doc.get(), object, "width", bounds.width);
    yyjson_mut_obj_add_int(doc.get(), object, "height", bounds.height);

    auto text = json::write(doc);
    if (!text)
    {
        return false;
    }
    if (!database_->set_setting(kRestoreBoundsKey, *text))
    {
        FK_LOG_WARN("failed to persist {}", kRestoreBoundsKey);
        return false;
    }
    return true;
}

std::optional<chrome::WindowState>
WindowSettingsStore::load_window_state() const
{
    if (!usable())
    {
        return std::nullopt;
    }
    auto stored = database_->get_setting(kWindowStateKey);
    if (!stored)
    {
        return std::nullopt;
    }
    return parse_window_state(*stored);
}

bool WindowSettingsStore::save_window_state(chrome::WindowState state)
{
    if (!usable())
    {
        return false;
    }
    if (!database_->set_setting(kWindowStateKey, chrome::to_string(state)))
    {
        FK_LOG_WARN("failed to persist {}", kWindowStateKey);
        return false;
    }
    return true;
}

} // namespace fk::app
