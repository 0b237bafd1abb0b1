#pragma once

#include <string_view>
#include <optional>
#include <concepts>
#include <cstring>

/**
 * @brief Copies a string into a caller supplied fixed-size buffer.
 *
 * The buffer is cleared first and the result is always null terminated,
 * truncating src if it does not fit.
 *
 * @tparam size_type An unsigned integral type for size parameters
 * @param dest Destination buffer (must not be nullptr)
 * @param dest_size Pointer to buffer size (input: max size, output: actual size including null terminator)
 * @param src Source string to copy
 * @return Optional containing the number of characters copied (excluding null terminator), or nullopt on error
 */
template<typename size_type>
    requires std::unsigned_integral<size_type>
auto fixedStringCopy(char* const dest, size_type* dest_size, std::string_view src)
    -> std::optional<size_type> {
    if (dest == nullptr || dest_size == nullptr || *dest_size == 0) {
        return std::nullopt;
    }

    memset(dest, 0, *dest_size);
    size_type size = static_cast<size_type>(src.copy(dest, *dest_size - 1));
    dest[size] = '\0';
    *dest_size = size + 1;
    return size;
}
