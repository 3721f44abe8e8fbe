#include "chrome/Region.hpp"

#include <utility>

namespace fk::chrome
{

namespace
{
std::vector<RectInt> subtract_all(std::vector<RectInt> const &from,
                                  RectInt const &hole)
{
    std::vector<RectInt> result;
    result.reserve(from.size() + 3);
    for (auto const &rect : from)
    {
        for (auto const &piece : subtract(rect, hole))
        {
            result.push_back(piece);
        }
    }
    return result;
}
} // namespace

Region Region::whole_caption(SizeInt client_size)
{
    Region region;
    RectInt client{0, 0, client_size.width, client_size.height};
    if (!client.is_empty())
    {
        region.caption_.push_back(client);
    }
    return region;
}

Region Region::all_passthrough(SizeInt client_size)
{
    Region region;
    RectInt client{0, 0, client_size.width, client_size.height};
    if (!client.is_empty())
    {
        region.passthrough_.push_back(client);
    }
    return region;
}

void Region::add_passthrough(RectInt const &rect)
{
    if (rect.is_empty())
    {
        return;
    }
    std::vector<RectInt> incoming{rect};
    for (auto const &existing : passthrough_)
    {
        incoming = subtract_all(incoming, existing);
        if (incoming.empty())
        {
            break;
        }
    }
    for (auto &piece : incoming)
    {
        passthrough_.push_back(piece);
    }
    caption_ = subtract_all(caption_, rect);
}

} // namespace fk::chrome
