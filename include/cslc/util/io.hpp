#ifndef CSLC_IO_HPP
#define CSLC_IO_HPP

#include <memory_resource>
#include <string_view>
#include <vector>

#include "cslc/util/result.hpp"

#include "cslc/fwd.hpp"

namespace cslc {

enum struct IO_Error_Code : Default_Underlying {
    /// @brief The file couldn't be opened.
    /// This may be due to disk errors, security issues, bad file paths, or other issues.
    cannot_open,
    /// @brief An error occurred while reading a file.
    read_error,
    /// @brief The file is not properly encoded.
    /// For example, if an attempt is made to read a text file as UTF-8 that is not encoded as such.
    corrupted,
};

[[nodiscard]]
constexpr std::u8string_view io_error_code_message(IO_Error_Code code)
{
    switch (code) {
    case IO_Error_Code::cannot_open: return u8"Failed to open file.";
    case IO_Error_Code::read_error: return u8"I/O error occurred when reading from file.";
    case IO_Error_Code::corrupted: return u8"Data in the file is corrupted (not properly encoded).";
    }
    return u8"Unknown I/O error.";
}

/// @brief Reads the file at `path` and appends its contents to `out`.
/// On failure, `out` is left with its original size.
/// Returns `IO_Error_Code::corrupted` if the contents are not valid UTF-8.
[[nodiscard]]
Result<void, IO_Error_Code> load_utf8_file(std::pmr::vector<char8_t>& out, std::u8string_view path);

[[nodiscard]]
Result<std::pmr::vector<char8_t>, IO_Error_Code>
load_utf8_file(std::u8string_view path, std::pmr::memory_resource* memory);

} // namespace cslc

#endif
