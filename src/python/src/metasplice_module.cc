#include "metasplice/build_info.h"
#include "metasplice/console_format.h"
#include "metasplice/mapped_file.h"
#include "metasplice/meta_write.h"
#include "metasplice/metadata_request.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>

#include <cstdio>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace metasplice {
namespace {

    static nb::str sv_to_py(std::string_view s)
    {
        return nb::str(s.data(), s.size());
    }


    static std::pair<std::string, std::string> info_lines()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        return { std::move(line1), std::move(line2) };
    }


    static std::span<const std::byte> as_span(const nb::bytes& data)
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(data.data()), data.size());
    }


    /// Accepts `str` (UTF-8) and `bytes` values.
    static MetadataRequest request_from_python(const nb::dict& fields)
    {
        MetadataRequest request;
        for (auto item : fields) {
            const std::string key = nb::cast<std::string>(item.first);
            if (nb::isinstance<nb::bytes>(item.second)) {
                const nb::bytes b = nb::cast<nb::bytes>(item.second);
                request.set(key, std::string_view(b.c_str(), b.size()));
            } else {
                request.set(key, nb::cast<std::string>(item.second));
            }
        }
        return request;
    }


    static std::string failure_message(const WriteResult& r)
    {
        char buf[160];
        std::snprintf(buf, sizeof(buf),
                      "%s %s at offset %llu (expected %llu, found %llu)",
                      container_format_name(r.format),
                      write_status_name(r.status),
                      static_cast<unsigned long long>(r.offset),
                      static_cast<unsigned long long>(r.expected),
                      static_cast<unsigned long long>(r.found));
        std::string msg(buf);
        if (r.what) {
            msg.append(": ");
            msg.append(r.what);
        }
        return msg;
    }


    static WriteOptions make_options(uint32_t bmff_padding,
                                     const std::string& handler_type,
                                     bool merge_xmp, uint32_t xmp_padding,
                                     const std::string& vendor,
                                     uint64_t max_output_bytes)
    {
        WriteOptions options;
        options.bmff.padding = bmff_padding;
        if (!handler_type.empty()) {
            if (handler_type.size() != 4U) {
                throw std::invalid_argument(
                    "handler_type must be a four-character code");
            }
            options.bmff.handler_type = fourcc(handler_type[0],
                                               handler_type[1],
                                               handler_type[2],
                                               handler_type[3]);
        }
        options.xmp.merge_existing      = merge_xmp;
        options.xmp.padding_bytes       = xmp_padding;
        options.vendor                  = vendor;
        options.limits.max_output_bytes = max_output_bytes;
        return options;
    }


    static nb::bytes write_bytes(nb::bytes data, const nb::dict& fields,
                                 uint32_t bmff_padding,
                                 const std::string& handler_type,
                                 bool merge_xmp, uint32_t xmp_padding,
                                 const std::string& vendor,
                                 uint64_t max_output_bytes)
    {
        const MetadataRequest request = request_from_python(fields);
        const WriteOptions options = make_options(bmff_padding, handler_type,
                                                  merge_xmp, xmp_padding,
                                                  vendor, max_output_bytes);
        std::vector<std::byte> out;
        WriteResult r;
        {
            nb::gil_scoped_release gil_release;
            r = write_metadata(as_span(data), request, options, &out);
        }
        if (r.status != WriteStatus::Ok) {
            throw std::runtime_error(failure_message(r));
        }
        return nb::bytes(reinterpret_cast<const char*>(out.data()), out.size());
    }


    static nb::bytes write_path(const std::string& path, const nb::dict& fields,
                                uint32_t bmff_padding,
                                const std::string& handler_type,
                                bool merge_xmp, uint32_t xmp_padding,
                                const std::string& vendor,
                                uint64_t max_file_bytes,
                                uint64_t max_output_bytes)
    {
        MappedFile file;
        const MappedFileStatus st = file.open(path.c_str(), max_file_bytes);
        if (st != MappedFileStatus::Ok) {
            throw std::runtime_error(std::string("failed to map file: ")
                                     + mapped_file_status_name(st));
        }
        const MetadataRequest request = request_from_python(fields);
        const WriteOptions options = make_options(bmff_padding, handler_type,
                                                  merge_xmp, xmp_padding,
                                                  vendor, max_output_bytes);
        std::vector<std::byte> out;
        WriteResult r;
        {
            nb::gil_scoped_release gil_release;
            r = write_metadata(file.bytes(), request, options, &out);
        }
        if (r.status != WriteStatus::Ok) {
            throw std::runtime_error(failure_message(r));
        }
        return nb::bytes(reinterpret_cast<const char*>(out.data()), out.size());
    }


    static std::pair<std::string, bool> console_text(nb::bytes data,
                                                     uint32_t max_bytes)
    {
        const std::string_view s(data.c_str(), data.size());
        std::string out;
        const bool escaped = append_console_escaped_ascii(s, max_bytes, &out);
        return { std::move(out), escaped };
    }

}  // namespace
}  // namespace metasplice


NB_MODULE(_metasplice, m)
{
    using namespace metasplice;

    m.doc()               = "metasplice metadata writing bindings (nanobind).";
    m.attr("__version__") = sv_to_py(build_info().version);

    nb::enum_<ContainerFormat>(m, "ContainerFormat")
        .value("Unknown", ContainerFormat::Unknown)
        .value("Jpeg", ContainerFormat::Jpeg)
        .value("Png", ContainerFormat::Png)
        .value("Riff", ContainerFormat::Riff)
        .value("Ogg", ContainerFormat::Ogg)
        .value("Flac", ContainerFormat::Flac)
        .value("Mp3", ContainerFormat::Mp3)
        .value("Asf", ContainerFormat::Asf)
        .value("Bmff", ContainerFormat::Bmff)
        .value("Matroska", ContainerFormat::Matroska);

    m.def(
        "detect_format",
        [](nb::bytes data) { return detect_container_format(as_span(data)); },
        "data"_a);

    m.def("write_metadata", &write_bytes, "data"_a, "fields"_a,
          "bmff_padding"_a = 0U, "handler_type"_a = std::string(),
          "merge_xmp"_a = true, "xmp_padding"_a = 0U,
          "vendor"_a = std::string("metasplice"), "max_output_bytes"_a = 0ULL,
          "Returns a copy of `data` with `fields` written into its metadata.");

    m.def("write_file", &write_path, "path"_a, "fields"_a,
          "bmff_padding"_a = 0U, "handler_type"_a = std::string(),
          "merge_xmp"_a = true, "xmp_padding"_a = 0U,
          "vendor"_a = std::string("metasplice"), "max_file_bytes"_a = 0ULL,
          "max_output_bytes"_a = 0ULL,
          "Maps `path` and returns the rewritten file contents.");

    m.def("console_text", &console_text, "data"_a, "max_bytes"_a = 4096U);

    m.def("build_info", []() {
        const BuildInfo& bi = build_info();
        nb::dict d;
        d["version"]              = sv_to_py(bi.version);
        d["build_timestamp_utc"]  = sv_to_py(bi.build_timestamp_utc);
        d["build_type"]           = sv_to_py(bi.build_type);
        d["cmake_generator"]      = sv_to_py(bi.cmake_generator);
        d["system_name"]          = sv_to_py(bi.system_name);
        d["system_processor"]     = sv_to_py(bi.system_processor);
        d["cxx_compiler_id"]      = sv_to_py(bi.cxx_compiler_id);
        d["cxx_compiler_version"] = sv_to_py(bi.cxx_compiler_version);
        d["option_with_zlib"]     = nb::bool_(bi.option_with_zlib);
        d["option_with_expat"]    = nb::bool_(bi.option_with_expat);
        d["has_zlib"]             = nb::bool_(bi.has_zlib);
        d["has_expat"]            = nb::bool_(bi.has_expat);
        return d;
    });

    m.def("build_info_lines", &info_lines);
}
