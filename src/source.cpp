#include <pid_image/source.hpp>
#include "codecs/byte_io.hpp"

#include <string>

namespace pid_image {

// ============================================================================
// Span Source
// ============================================================================

std::uint8_t span_source::read_u8(std::size_t offset) const {
    return data_[offset];
}

std::uint32_t span_source::read_u32_le(std::size_t offset) const {
    return read_le32(data_.data() + offset);
}

std::int32_t span_source::read_i32_le(std::size_t offset) const {
    return read_le32_signed(data_.data() + offset);
}

// ============================================================================
// Host Source
// ============================================================================

std::uint8_t host_source::read_u8(std::size_t offset) const {
    return fns_.get_u8(static_cast<std::uint32_t>(offset));
}

std::uint32_t host_source::read_u32_le(std::size_t offset) const {
    return fns_.get_u32_le(static_cast<std::uint32_t>(offset));
}

std::int32_t host_source::read_i32_le(std::size_t offset) const {
    return fns_.get_i32_le(static_cast<std::uint32_t>(offset));
}

// ============================================================================
// Byte Cursor
// ============================================================================

decode_result byte_cursor::check(std::size_t width) const {
    const std::size_t size = source_.size();
    if (offset_ > size || width > size - offset_) {
        return decode_result::failure(decode_error::out_of_bounds,
            "Read of " + std::to_string(width) + " byte(s) at offset " +
            std::to_string(offset_) + " past end of data (" +
            std::to_string(size) + " bytes)");
    }
    return decode_result::success();
}

decode_result byte_cursor::next_u8(std::uint8_t& value) {
    auto result = check(1);
    if (!result) {
        return result;
    }
    value = source_.read_u8(offset_);
    offset_ += 1;
    return result;
}

decode_result byte_cursor::next_u32_le(std::uint32_t& value) {
    auto result = check(4);
    if (!result) {
        return result;
    }
    value = source_.read_u32_le(offset_);
    offset_ += 4;
    return result;
}

decode_result byte_cursor::next_i32_le(std::int32_t& value) {
    auto result = check(4);
    if (!result) {
        return result;
    }
    value = source_.read_i32_le(offset_);
    offset_ += 4;
    return result;
}

} // namespace pid_image
