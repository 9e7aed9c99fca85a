#include "metasplice/meta_write.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <vector>

namespace metasplice {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}


static MetadataRequest
make_request(uint8_t selector)
{
    MetadataRequest request;
    request.set("Title", "fuzz title");
    if ((selector & 0x01U) != 0U) {
        request.set("XMP:Title", "Sunset \xC3\xA9t\xC3\xA9");
    }
    if ((selector & 0x02U) != 0U) {
        request.set("Artist", "metasplice");
    }
    if ((selector & 0x04U) != 0U) {
        request.set("ICC_Profile", "");
    }
    if ((selector & 0x08U) != 0U) {
        request.set("JFIF:Units", "1");
    }
    return request;
}

}  // namespace metasplice

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace metasplice;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    const MetadataRequest request = make_request(size != 0U ? data[size - 1U]
                                                            : 0U);
    WriteOptions options;
    options.limits.max_output_bytes = static_cast<uint64_t>(size) + (1U << 20);
    options.limits.max_blocks       = 4096;

    std::vector<std::byte> out;
    const WriteResult res = write_metadata(bytes, request, options, &out);
    if (res.status != WriteStatus::Ok) {
        if (!out.empty()) {
            fuzz_trap();
        }
        return 0;
    }
    if (out.empty() || out.size() > options.limits.max_output_bytes) {
        fuzz_trap();
    }
    if (detect_container_format(out) != res.format) {
        fuzz_trap();
    }
    return 0;
}
