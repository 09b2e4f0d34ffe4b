#pragma once

/**
 * @file slip.hpp
 * @brief SLIP frame encoder used to put one chunk on a serial link as one frame.
 *
 * @details
 * A serial port is a byte stream; the radio on the other end needs to know
 * where one chunk stops and the next begins. Each chunk is wrapped in a SLIP
 * (RFC 1055) frame:
 *
 *   END (0xC0) ... payload, with END → ESC ESC_END and ESC → ESC ESC_ESC ... END
 *
 * Chunk text is plain ASCII/UTF-8 in practice, so escapes are rare, but the
 * encoder handles any byte value. Only the send direction lives here; MeshSplit
 * hands chunks to the radio and does not read frames back.
 *
 * @code
 *   std::vector<uint8_t> frame;
 *   meshsplit::slip::encode(reinterpret_cast<const uint8_t*>("(1/2) hi "), 9, frame);
 *   // frame: C0 28 31 2F 32 29 20 68 69 20 C0
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace meshsplit {
namespace slip {

static constexpr uint8_t END     = 0xC0; ///< Frame boundary
static constexpr uint8_t ESC     = 0xDB; ///< Escape introducer
static constexpr uint8_t ESC_END = 0xDC; ///< ESC ESC_END decodes to END
static constexpr uint8_t ESC_ESC = 0xDD; ///< ESC ESC_ESC decodes to ESC

/**
 * @brief Encode `n` payload bytes into one SLIP frame.
 * @param in  Payload bytes.
 * @param n   Payload length.
 * @param out Receives the frame; cleared first. Reserves 2n + 2 bytes.
 */
inline void encode(const uint8_t* in, std::size_t n, std::vector<uint8_t>& out) {
    out.clear();
    out.reserve(n * 2 + 2);                 // every byte escaped, plus both ENDs

    out.push_back(END);
    for (std::size_t i = 0; i < n; ++i) {
        const uint8_t b = in[i];
        if (b == END) {
            out.push_back(ESC);
            out.push_back(ESC_END);
        } else if (b == ESC) {
            out.push_back(ESC);
            out.push_back(ESC_ESC);
        } else {
            out.push_back(b);
        }
    }
    out.push_back(END);
}

} // namespace slip
} // namespace meshsplit
