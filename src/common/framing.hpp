// SPDX-License-Identifier: Apache-2.0
// Length-prefixed framing: 4-byte big-endian payload length followed by the payload bytes.
#pragma once
#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace astro::netutil {

// Largest payload accepted from a peer. Full-state snapshots for 15 players stay well below this.
inline constexpr uint32_t kMaxFramePayload = 1u << 20;

inline void append_frame(std::string &out, const std::string &payload)
{
    uint32_t net = htonl(static_cast<uint32_t>(payload.size()));
    size_t offset = out.size();
    out.resize(offset + 4 + payload.size());
    std::memcpy(out.data() + offset, &net, 4);
    std::memcpy(out.data() + offset + 4, payload.data(), payload.size());
}

inline std::string build_frame(const std::string &payload)
{
    std::string frame;
    frame.reserve(4 + payload.size());
    append_frame(frame, payload);
    return frame;
}

enum class ExtractResult
{
    complete,
    need_more,
    invalid // zero or oversized length header; the stream cannot be resynchronised
};

struct FrameParseState
{
    std::vector<char> buffer; // accumulated bytes
    uint32_t expected_len{0};
    bool have_len{false};

    void feed(std::span<const char> bytes) { buffer.insert(buffer.end(), bytes.begin(), bytes.end()); }
};

// Extracts at most one payload into out.
inline ExtractResult try_extract(FrameParseState &st, std::string &out)
{
    if (!st.have_len) {
        if (st.buffer.size() < 4)
            return ExtractResult::need_more;
        uint32_t net;
        std::memcpy(&net, st.buffer.data(), 4);
        st.expected_len = ntohl(net);
        if (st.expected_len == 0 || st.expected_len > kMaxFramePayload)
            return ExtractResult::invalid;
        st.have_len = true;
    }
    if (st.buffer.size() < 4 + static_cast<size_t>(st.expected_len))
        return ExtractResult::need_more;
    out.assign(st.buffer.data() + 4, st.expected_len);
    st.buffer.erase(st.buffer.begin(), st.buffer.begin() + 4 + st.expected_len);
    st.have_len = false;
    st.expected_len = 0;
    return ExtractResult::complete;
}

} // namespace astro::netutil
