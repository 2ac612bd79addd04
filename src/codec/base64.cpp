#include "gidkit/codec/base64.hpp"

#include <cstddef>
#include <cstring>
#include <new>

#if defined(GIDKIT_HAVE_LIBSODIUM)
#include <sodium.h>
#endif

#if defined(GIDKIT_HAVE_OPENSSL)
#include <openssl/evp.h>
#endif

namespace gidkit::codec {
    namespace {
        [[nodiscard]] gidkit::core::Status invalid_encoding() noexcept {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Codec, gidkit::core::StatusCode::InvalidEncoding);
        }

        [[nodiscard]] gidkit::core::Status out_of_memory() noexcept {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Codec, gidkit::core::StatusCode::OutOfMemory);
        }

#if defined(GIDKIT_HAVE_LIBSODIUM)
        gidkit::core::Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return gidkit::core::make_status(gidkit::core::StatusDomain::External, gidkit::core::StatusCode::Unavailable);
            }
            return gidkit::core::ok_status();
        }
#elif defined(GIDKIT_HAVE_OPENSSL)
        [[nodiscard]] bool urlsafe_char(char c) noexcept {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                   c == '-' || c == '_';
        }

        [[nodiscard]] u8 urlsafe_sextet(char c) noexcept {
            if (c >= 'A' && c <= 'Z') return static_cast<u8>(c - 'A');
            if (c >= 'a' && c <= 'z') return static_cast<u8>(c - 'a' + 26);
            if (c >= '0' && c <= '9') return static_cast<u8>(c - '0' + 52);
            return c == '-' ? 62 : 63;
        }

        // The last character of a short group carries bits past the final
        // byte; they must be zero so every byte string has one spelling.
        [[nodiscard]] bool tail_bits_zero(std::string_view in) noexcept {
            const u8 last = urlsafe_sextet(in.back());
            switch (in.size() % 4u) {
            case 2: return (last & 0x0fu) == 0;
            case 3: return (last & 0x03u) == 0;
            default: return true;
            }
        }
#endif
    } // namespace

    gidkit::core::Status base64url_encode(BufferView in, std::string* out) noexcept {
        if (out == nullptr || !buffer_ok(in)) {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Codec, gidkit::core::StatusCode::Invalid);
        }
        out->clear();
        if (in.len == 0) {
            return gidkit::core::ok_status();
        }

#if defined(GIDKIT_HAVE_LIBSODIUM)
        const gidkit::core::Status init = ensure_sodium();
        if (!gidkit::core::is_ok(init)) {
            return init;
        }

        const size_t cap = sodium_base64_ENCODED_LEN(in.len, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
        try {
            out->resize(cap);
        } catch (const std::bad_alloc&) {
            return out_of_memory();
        }
        sodium_bin2base64(out->data(), cap, in.data, in.len, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
        out->resize(std::strlen(out->c_str()));
        return gidkit::core::ok_status();
#elif defined(GIDKIT_HAVE_OPENSSL)
        const size_t cap = 4u * ((static_cast<size_t>(in.len) + 2u) / 3u) + 1u;
        try {
            out->resize(cap);
        } catch (const std::bad_alloc&) {
            return out_of_memory();
        }

        const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out->data()), in.data, static_cast<int>(in.len));
        if (n < 0) {
            out->clear();
            return gidkit::core::make_status(gidkit::core::StatusDomain::External, gidkit::core::StatusCode::Unknown);
        }

        size_t len = static_cast<size_t>(n);
        while (len > 0 && (*out)[len - 1] == '=') {
            --len;
        }
        out->resize(len);
        for (char& c : *out) {
            if (c == '+') c = '-';
            else if (c == '/') c = '_';
        }
        return gidkit::core::ok_status();
#else
        return gidkit::core::make_status(gidkit::core::StatusDomain::External, gidkit::core::StatusCode::Unavailable);
#endif
    }

    gidkit::core::Status base64url_decode(std::string_view in, std::vector<u8>* out) noexcept {
        if (out == nullptr) {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Codec, gidkit::core::StatusCode::Invalid);
        }
        out->clear();
        if (in.empty()) {
            return gidkit::core::ok_status();
        }
        // A single trailing sextet cannot carry a whole byte.
        if (in.size() % 4u == 1u) {
            return invalid_encoding();
        }

#if defined(GIDKIT_HAVE_LIBSODIUM)
        const gidkit::core::Status init = ensure_sodium();
        if (!gidkit::core::is_ok(init)) {
            return init;
        }

        try {
            out->resize((in.size() * 3u) / 4u + 1u);
        } catch (const std::bad_alloc&) {
            return out_of_memory();
        }

        size_t bin_len = 0;
        const int rc = sodium_base642bin(out->data(), out->size(),
            in.data(), in.size(),
            nullptr,
            &bin_len,
            nullptr,
            sodium_base64_VARIANT_URLSAFE_NO_PADDING);
        if (rc != 0) {
            out->clear();
            return invalid_encoding();
        }
        out->resize(bin_len);
        return gidkit::core::ok_status();
#elif defined(GIDKIT_HAVE_OPENSSL)
        for (char c : in) {
            if (!urlsafe_char(c)) {
                return invalid_encoding();
            }
        }
        if (!tail_bits_zero(in)) {
            return invalid_encoding();
        }

        const size_t pad = (4u - in.size() % 4u) % 4u;
        std::string std_alphabet;
        try {
            std_alphabet.reserve(in.size() + pad);
            for (char c : in) {
                std_alphabet.push_back(c == '-' ? '+' : (c == '_' ? '/' : c));
            }
            std_alphabet.append(pad, '=');
            out->resize((std_alphabet.size() / 4u) * 3u);
        } catch (const std::bad_alloc&) {
            out->clear();
            return out_of_memory();
        }

        const int n = EVP_DecodeBlock(out->data(),
            reinterpret_cast<const unsigned char*>(std_alphabet.data()),
            static_cast<int>(std_alphabet.size()));
        if (n < 0 || static_cast<size_t>(n) < pad) {
            out->clear();
            return invalid_encoding();
        }
        out->resize(static_cast<size_t>(n) - pad);
        return gidkit::core::ok_status();
#else
        return gidkit::core::make_status(gidkit::core::StatusDomain::External, gidkit::core::StatusCode::Unavailable);
#endif
    }
} // namespace gidkit::codec
