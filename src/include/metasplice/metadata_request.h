#pragma once

#include <cstddef>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file metadata_request.h
 * \brief Flat, namespaced key/value mapping consumed by the writers.
 */

namespace metasplice {

/// One request entry. Values are byte strings; text values are UTF-8.
struct MetadataField final {
    std::string key;
    std::string value;
};

/**
 * \brief Resolved metadata to write, keyed by namespaced names.
 *
 * Keys follow the `Group:Name` convention (`XMP:Title`, `EXIF:Artist`,
 * `QuickTime:Title`, `Vorbis:ALBUM`, ...); bare names such as `Title` act as
 * group-less fallbacks. Keys are case-sensitive and unique; entries are kept
 * sorted by key so that every group forms one contiguous range.
 *
 * Writers only read from a request.
 */
class MetadataRequest final {
public:
    MetadataRequest() = default;
    MetadataRequest(std::initializer_list<MetadataField> fields);

    /// Inserts or replaces \p key.
    void set(std::string_view key, std::string_view value);
    /// Removes \p key; returns false when it was not present.
    bool erase(std::string_view key) noexcept;

    /// Returns the value stored for \p key, or nullptr.
    const std::string* find(std::string_view key) const noexcept;

    /// Returns the value of the first key in \p keys that is present.
    const std::string*
    first_of(std::initializer_list<std::string_view> keys) const noexcept;

    /// All entries whose key starts with \p prefix (e.g. "XMP:").
    std::span<const MetadataField>
    with_prefix(std::string_view prefix) const noexcept;

    bool has_prefix(std::string_view prefix) const noexcept
    {
        return !with_prefix(prefix).empty();
    }

    std::span<const MetadataField> fields() const noexcept
    {
        return std::span<const MetadataField>(fields_.data(), fields_.size());
    }

    bool empty() const noexcept { return fields_.empty(); }
    size_t size() const noexcept { return fields_.size(); }

private:
    std::vector<MetadataField> fields_;
};

/// Strips the `Group:` part from \p key (returns \p key if it has none).
std::string_view
key_local_name(std::string_view key) noexcept;

}  // namespace metasplice
