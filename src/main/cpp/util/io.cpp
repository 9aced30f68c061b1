#include <cstddef>
#include <cstdio>
#include <memory>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "cslc/util/io.hpp"
#include "cslc/util/result.hpp"
#include "cslc/util/unicode.hpp"

namespace cslc {
namespace {

struct File_Closer {
    void operator()(std::FILE* file) const noexcept
    {
        std::fclose(file);
    }
};

using Unique_File = std::unique_ptr<std::FILE, File_Closer>;

[[nodiscard]]
Result<void, IO_Error_Code>
append_file_bytes(std::pmr::vector<char8_t>& out, std::u8string_view path)
{
    if (path.find(u8'\0') != std::u8string_view::npos) {
        return IO_Error_Code::cannot_open;
    }
    const std::string terminated_path(path.begin(), path.end());
    const Unique_File file { std::fopen(terminated_path.c_str(), "rb") };
    if (!file) {
        return IO_Error_Code::cannot_open;
    }

    constexpr std::size_t chunk_size = BUFSIZ;
    while (true) {
        const std::size_t old_size = out.size();
        out.resize(old_size + chunk_size);
        const std::size_t read_size = std::fread(out.data() + old_size, 1, chunk_size, file.get());
        out.resize(old_size + read_size);
        if (std::ferror(file.get())) {
            return IO_Error_Code::read_error;
        }
        if (read_size < chunk_size) {
            return {};
        }
    }
}

} // namespace

Result<void, IO_Error_Code> load_utf8_file(std::pmr::vector<char8_t>& out, std::u8string_view path)
{
    const std::size_t initial_size = out.size();
    if (const Result<void, IO_Error_Code> r = append_file_bytes(out, path); !r) {
        out.resize(initial_size);
        return r;
    }
    const std::u8string_view str { out.data() + initial_size, out.size() - initial_size };
    if (!utf8::is_valid(str)) {
        out.resize(initial_size);
        return IO_Error_Code::corrupted;
    }
    return {};
}

Result<std::pmr::vector<char8_t>, IO_Error_Code>
load_utf8_file(std::u8string_view path, std::pmr::memory_resource* memory)
{
    std::pmr::vector<char8_t> result { memory };
    if (auto r = load_utf8_file(result, path); !r) {
        return r.error();
    }
    return result;
}

} // namespace cslc
