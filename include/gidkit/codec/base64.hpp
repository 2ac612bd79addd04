#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "gidkit/codec/buffer.hpp"
#include "gidkit/core/errors.hpp"

namespace gidkit::codec {

    // RFC 4648 section 5 alphabet ('-' and '_'), never padded with '='.
    // Decoding rejects padding, whitespace and characters from the standard
    // alphabet with (Codec, InvalidEncoding).

    gidkit::core::Status base64url_encode(BufferView in, std::string* out) noexcept;

    gidkit::core::Status base64url_decode(std::string_view in, std::vector<u8>* out) noexcept;

    [[nodiscard]] constexpr u32 base64url_encoded_len(u32 bin_len) noexcept {
        return (bin_len / 3u) * 4u + ((bin_len % 3u) * 4u + 2u) / 3u;
    }

} // namespace gidkit::codec
