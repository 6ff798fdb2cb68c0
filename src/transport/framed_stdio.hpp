// src/transport/framed_stdio.hpp
#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace transport
{

    // Evaluation requests carry whole rule sets; 1 MiB is plenty
    constexpr uint32_t kMaxFrameBytes = 1024u * 1024u;

    enum class ReadStatus
    {
        Frame, // payload read into out
        Eof,   // stream ended cleanly before a header
        Error  // truncated or invalid frame; err describes it
    };

    // Reads one length-prefixed frame (uint32_le + payload bytes).
    ReadStatus read_frame(std::istream &in, std::vector<uint8_t> &out, std::string &err,
                          uint32_t max_len = kMaxFrameBytes);

    // Writes one length-prefixed frame and flushes.
    // Returns false on error and sets err.
    bool write_frame(std::ostream &out, const std::string &payload, std::string &err,
                     uint32_t max_len = kMaxFrameBytes);

} // namespace transport
