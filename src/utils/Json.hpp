#pragma once

#include <climits>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <yyjson.h>

namespace fk::json
{

struct DocumentDeleter
{
    void operator()(yyjson_doc *doc) const noexcept
    {
        yyjson_doc_free(doc);
    }
};

struct MutableDocumentDeleter
{
    void operator()(yyjson_mut_doc *doc) const noexcept
    {
        yyjson_mut_doc_free(doc);
    }
};

using Document = std::unique_ptr<yyjson_doc, DocumentDeleter>;
using MutableDocument = std::unique_ptr<yyjson_mut_doc, MutableDocumentDeleter>;

// Null on malformed input.
inline Document parse(std::string_view text)
{
    return Document(yyjson_read(text.data(), text.size(), YYJSON_READ_NOFLAG));
}

inline yyjson_val *root(Document const &doc) noexcept
{
    return doc ? yyjson_doc_get_root(doc.get()) : nullptr;
}

// Empty object as root; null when allocation fails.
inline MutableDocument make_object_document()
{
    MutableDocument doc(yyjson_mut_doc_new(nullptr));
    if (doc)
    {
        yyjson_mut_doc_set_root(doc.get(), yyjson_mut_obj(doc.get()));
    }
    return doc;
}

inline std::optional<std::string> write(MutableDocument const &doc)
{
    if (!doc)
    {
        return std::nullopt;
    }
    char *text = yyjson_mut_write(doc.get(), YYJSON_WRITE_NOFLAG, nullptr);
    if (text == nullptr)
    {
        return std::nullopt;
    }
    std::string result(text);
    std::free(text);
    return result;
}

// Integer member of an object that fits in an int.
inline std::optional<int> int_field(yyjson_val *object, char const *key)
{
    auto *value = yyjson_obj_get(object, key);
    if (yyjson_is_uint(value))
    {
        auto const number = yyjson_get_uint(value);
        if (number > static_cast<std::uint64_t>(INT_MAX))
        {
            return std::nullopt;
        }
        return static_cast<int>(number);
    }
    if (yyjson_is_sint(value))
    {
        auto const number = yyjson_get_sint(value);
        if (number < INT_MIN || number > INT_MAX)
        {
            return std::nullopt;
        }
        return static_cast<int>(number);
    }
    return std::nullopt;
}

} // namespace fk::json
