#ifndef LAMP_IO_HPP
#define LAMP_IO_HPP

#include <cstddef>
#include <cstdio>
#include <memory_resource>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "lamp/util/function_ref.hpp"
#include "lamp/util/result.hpp"

#include "lamp/fwd.hpp"

namespace lamp {

enum struct IO_Error_Code : Default_Underlying {
    /// @brief The file couldn't be opened.
    /// This may be due to a bad path, missing permissions, or other issues.
    cannot_open,
    /// @brief An error occurred while reading a file.
    read_error,
    /// @brief The file is not properly encoded as UTF-8.
    corrupted,
};

[[nodiscard]]
constexpr std::u8string_view io_error_code_message(IO_Error_Code e) noexcept
{
    switch (e) {
    case IO_Error_Code::cannot_open: return u8"The file could not be opened.";
    case IO_Error_Code::read_error: return u8"An error occurred while reading the file.";
    case IO_Error_Code::corrupted: return u8"The file is not valid UTF-8.";
    }
    return u8"";
}

/// @brief An owning handle to a C stream which is closed on destruction.
struct [[nodiscard]] Unique_File {
private:
    std::FILE* m_file = nullptr;

public:
    constexpr Unique_File() = default;

    constexpr Unique_File(std::FILE* f)
        : m_file { f }
    {
    }

    constexpr Unique_File(Unique_File&& other) noexcept
        : m_file { std::exchange(other.m_file, nullptr) }
    {
    }

    Unique_File(const Unique_File&) = delete;
    Unique_File& operator=(const Unique_File&) = delete;

    Unique_File& operator=(Unique_File&& other) noexcept
    {
        close();
        m_file = std::exchange(other.m_file, nullptr);
        return *this;
    }

    void close() noexcept
    {
        if (m_file) {
            std::fclose(m_file);
            m_file = nullptr;
        }
    }

    [[nodiscard]]
    constexpr std::FILE* get() const noexcept
    {
        return m_file;
    }

    [[nodiscard]]
    constexpr operator bool() const noexcept
    {
        return m_file != nullptr;
    }

    ~Unique_File()
    {
        close();
    }
};

/// @brief Reads all bytes from a file and calls a given consumer with them, chunk by chunk.
/// @param consume_chunk Invoked repeatedly with temporary chunks of bytes,
/// which must not be used after `consume_chunk` returns.
/// @param path the file path
[[nodiscard]]
Result<void, IO_Error_Code> file_to_bytes_chunked(
    Function_Ref<void(std::span<const std::byte>)> consume_chunk,
    std::u8string_view path
);

/// @brief Reads a whole file and verifies that it is valid UTF-8.
[[nodiscard]]
Result<std::pmr::vector<char8_t>, IO_Error_Code>
load_utf8_file(std::u8string_view path, std::pmr::memory_resource* memory);

} // namespace lamp

#endif
