#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

// Builders for small, structurally plausible JPEG streams used across tests.

namespace carvenet {
namespace test_support {

    static inline void push_u8(std::vector<std::byte>* out, uint8_t v)
    {
        out->push_back(std::byte { v });
    }


    static inline void push_u16be(std::vector<std::byte>* out, uint16_t v)
    {
        push_u8(out, static_cast<uint8_t>((v >> 8) & 0xFFU));
        push_u8(out, static_cast<uint8_t>(v & 0xFFU));
    }


    // SOI, APP0 (JFIF), DQT, SOS, scan data, EOI; exactly `total_size` bytes
    // (at least 101). Scan bytes never contain 0xFF, so the only markers are
    // the ones written here. Different seeds give different payloads.
    static inline std::vector<std::byte> make_jpeg(size_t total_size,
                                                   uint32_t seed)
    {
        std::vector<std::byte> out;
        out.reserve(total_size);
        push_u16be(&out, 0xFFD8U);

        push_u16be(&out, 0xFFE0U);
        push_u16be(&out, 16U);
        const char jfif[] = { 'J', 'F', 'I', 'F', 0 };
        for (const char c : jfif) {
            push_u8(&out, static_cast<uint8_t>(c));
        }
        push_u8(&out, 1U);  // version 1.1
        push_u8(&out, 1U);
        push_u8(&out, 0U);  // density units
        push_u16be(&out, 1U);
        push_u16be(&out, 1U);
        push_u8(&out, 0U);  // no thumbnail
        push_u8(&out, 0U);

        push_u16be(&out, 0xFFDBU);
        push_u16be(&out, 67U);
        push_u8(&out, 0U);
        for (uint32_t i = 0; i < 64U; ++i) {
            push_u8(&out, static_cast<uint8_t>(1U + ((i + seed) % 100U)));
        }

        push_u16be(&out, 0xFFDAU);
        push_u16be(&out, 8U);
        push_u8(&out, 1U);
        push_u8(&out, 1U);
        push_u8(&out, 0U);
        push_u8(&out, 0U);
        push_u8(&out, 0x3FU);
        push_u8(&out, 0U);

        size_t i = 0;
        while (out.size() + 2U < total_size) {
            push_u8(&out, static_cast<uint8_t>((seed * 31U + i * 7U) % 0xFEU));
            i += 1U;
        }
        push_u16be(&out, 0xFFD9U);
        return out;
    }


    static inline void place(std::vector<std::byte>* image, size_t offset,
                             std::span<const std::byte> bytes)
    {
        std::memcpy(image->data() + offset, bytes.data(), bytes.size());
    }

}  // namespace test_support
}  // namespace carvenet
