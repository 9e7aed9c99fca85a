#pragma once

#include "metasplice/metadata_request.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file xmp_packet.h
 * \brief XMP packet construction and merging for the container writers.
 *
 * Request keys of the form `XMP:<Name>` or `XMP:<prefix>:<Name>` become
 * top-level properties of a single `rdf:Description`. An existing packet can
 * be decoded (via Expat, when enabled) and merged so that properties not
 * named by the request survive a rewrite.
 */

namespace metasplice {

/// Container kind of an XMP property value.
enum class XmpArrayKind : uint8_t {
    /// Simple text value.
    None,
    /// `rdf:Alt` (language alternatives).
    Alt,
    /// `rdf:Seq`.
    Seq,
    /// `rdf:Bag`.
    Bag,
};

/// One top-level XMP property.
struct XmpProperty final {
    std::string ns_uri;
    /// Preferred prefix; a well-known or generated prefix is used when empty
    /// or already bound to another namespace.
    std::string prefix;
    std::string name;
    XmpArrayKind array = XmpArrayKind::None;
    /// One entry for simple values; one per `rdf:li` for arrays.
    std::vector<std::string> values;
    /// `xml:lang` per value (Alt only; empty means `x-default`).
    std::vector<std::string> langs;
};

/// Options for \ref build_xmp_packet.
struct XmpPacketOptions final {
    /// Decode the existing packet and keep properties the request does not set.
    bool merge_existing = true;
    /// Whitespace bytes reserved before the closing `xpacket` PI.
    uint32_t padding_bytes = 0;
    /// Value of the `x:xmptk` attribute.
    std::string toolkit = "metasplice";
};

enum class XmpReadStatus : uint8_t {
    Ok,
    /// Not XML, or built without Expat.
    Unsupported,
    Malformed,
};

/// Namespace URI for a prefix: the well-known table, else
/// `http://ns.adobe.com/<prefix>/1.0/`.
std::string
xmp_namespace_uri(std::string_view prefix);

/**
 * \brief Maps one request key (without the `XMP:` group) to a property.
 *
 * `Title`, `Description` and `Rights` become `dc` language alternatives,
 * `Creator` a `dc:creator` sequence, `Subject` a `dc:subject` bag; other bare
 * names land in the `xmp` namespace. `prefix:Name` selects the namespace.
 */
XmpProperty
xmp_property_for_key(std::string_view local_key, std::string_view value);

/// Collects every `XMP:*` field of \p request, in key order.
void
collect_xmp_properties(const MetadataRequest& request,
                       std::vector<XmpProperty>* out);

/**
 * \brief Decodes the top-level properties of an existing packet.
 *
 * Structured values (nested `rdf:Description` or `rdf:parseType`) are
 * skipped.
 */
XmpReadStatus
read_xmp_properties(std::span<const std::byte> packet,
                    std::vector<XmpProperty>* out) noexcept;

/**
 * \brief Overlays \p updates onto \p props.
 *
 * A property with the same namespace and name is replaced in place; new
 * properties are appended in \p updates order.
 */
void
merge_xmp_properties(std::span<const XmpProperty> updates,
                     std::vector<XmpProperty>* props);

/// Serializes \p props as a complete `xpacket`-wrapped packet.
void
append_xmp_packet(std::span<const XmpProperty> props,
                  const XmpPacketOptions& options,
                  std::vector<std::byte>* out);

/**
 * \brief Builds the packet for \p request, merging \p existing when asked.
 *
 * Returns false (and leaves \p out untouched) when the request has no
 * `XMP:*` field. An \p existing packet that cannot be decoded is replaced.
 */
bool
build_xmp_packet(const MetadataRequest& request,
                 std::span<const std::byte> existing,
                 const XmpPacketOptions& options,
                 std::vector<std::byte>* out);

}  // namespace metasplice
