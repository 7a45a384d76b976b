#include <cstddef>
#include <cstdio>
#include <cstring>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lamp/util/function_ref.hpp"
#include "lamp/util/io.hpp"
#include "lamp/util/result.hpp"
#include "lamp/util/unicode.hpp"

#include "lamp/fwd.hpp"

namespace lamp {

Result<void, IO_Error_Code> file_to_bytes_chunked(
    Function_Ref<void(std::span<const std::byte>)> consume_chunk,
    std::u8string_view path
)
{
    const std::string c_path(reinterpret_cast<const char*>(path.data()), path.size());
    const Unique_File stream = std::fopen(c_path.c_str(), "rb");
    if (!stream) {
        return IO_Error_Code::cannot_open;
    }

    constexpr std::size_t block_size = BUFSIZ;
    char buffer[block_size] {};

    std::size_t read_size;
    do {
        read_size = std::fread(buffer, 1, block_size, stream.get());
        if (std::ferror(stream.get())) {
            return IO_Error_Code::read_error;
        }
        consume_chunk({ reinterpret_cast<const std::byte*>(buffer), read_size });
    } while (read_size == block_size);

    return {};
}

Result<std::pmr::vector<char8_t>, IO_Error_Code>
load_utf8_file(std::u8string_view path, std::pmr::memory_resource* memory)
{
    std::pmr::vector<char8_t> result { memory };
    const Result<void, IO_Error_Code> r = file_to_bytes_chunked(
        [&result](std::span<const std::byte> chunk) {
            const std::size_t old_size = result.size();
            result.resize(old_size + chunk.size());
            if (!chunk.empty()) {
                std::memcpy(result.data() + old_size, chunk.data(), chunk.size());
            }
        },
        path
    );
    if (!r) {
        return r.error();
    }
    if (!utf8::is_valid({ result.data(), result.size() })) {
        return IO_Error_Code::corrupted;
    }
    return result;
}

} // namespace lamp
