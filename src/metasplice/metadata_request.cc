#include "metasplice/metadata_request.h"

#include <algorithm>

namespace metasplice {
namespace {

    struct KeyLess final {
        bool operator()(const MetadataField& a,
                        std::string_view b) const noexcept
        {
            return std::string_view(a.key) < b;
        }
        bool operator()(std::string_view a,
                        const MetadataField& b) const noexcept
        {
            return a < std::string_view(b.key);
        }
    };

}  // namespace

MetadataRequest::MetadataRequest(std::initializer_list<MetadataField> fields)
{
    fields_.reserve(fields.size());
    for (const MetadataField& f : fields) {
        set(f.key, f.value);
    }
}


void
MetadataRequest::set(std::string_view key, std::string_view value)
{
    auto it = std::lower_bound(fields_.begin(), fields_.end(), key,
                               KeyLess {});
    if (it != fields_.end() && std::string_view(it->key) == key) {
        it->value.assign(value.data(), value.size());
        return;
    }
    MetadataField f;
    f.key.assign(key.data(), key.size());
    f.value.assign(value.data(), value.size());
    fields_.insert(it, std::move(f));
}


bool
MetadataRequest::erase(std::string_view key) noexcept
{
    auto it = std::lower_bound(fields_.begin(), fields_.end(), key,
                               KeyLess {});
    if (it == fields_.end() || std::string_view(it->key) != key) {
        return false;
    }
    fields_.erase(it);
    return true;
}


const std::string*
MetadataRequest::find(std::string_view key) const noexcept
{
    auto it = std::lower_bound(fields_.begin(), fields_.end(), key,
                               KeyLess {});
    if (it == fields_.end() || std::string_view(it->key) != key) {
        return nullptr;
    }
    return &it->value;
}


const std::string*
MetadataRequest::first_of(
    std::initializer_list<std::string_view> keys) const noexcept
{
    for (std::string_view k : keys) {
        const std::string* v = find(k);
        if (v) {
            return v;
        }
    }
    return nullptr;
}


std::span<const MetadataField>
MetadataRequest::with_prefix(std::string_view prefix) const noexcept
{
    auto first = std::lower_bound(fields_.begin(), fields_.end(), prefix,
                                  KeyLess {});
    auto last = first;
    while (last != fields_.end()
           && std::string_view(last->key).substr(0, prefix.size())
                  == prefix) {
        ++last;
    }
    if (first == last) {
        return {};
    }
    return std::span<const MetadataField>(&*first,
                                          static_cast<size_t>(last - first));
}


std::string_view
key_local_name(std::string_view key) noexcept
{
    const size_t colon = key.find(':');
    if (colon == std::string_view::npos) {
        return key;
    }
    return key.substr(colon + 1);
}

}  // namespace metasplice
