// src/transport/framed_stdio.cpp
#include "framed_stdio.hpp"

#include <array>

namespace transport
{

    namespace
    {

        constexpr std::size_t kHeaderBytes = 4;

        uint32_t decode_length(const std::array<uint8_t, kHeaderBytes> &b)
        {
            uint32_t v = 0;
            for (std::size_t i = 0; i < kHeaderBytes; ++i)
            {
                v |= static_cast<uint32_t>(b[i]) << (8 * i);
            }
            return v;
        }

        std::array<uint8_t, kHeaderBytes> encode_length(uint32_t v)
        {
            std::array<uint8_t, kHeaderBytes> b{};
            for (std::size_t i = 0; i < kHeaderBytes; ++i)
            {
                b[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
            }
            return b;
        }

        // Number of bytes actually read; less than n means EOF or stream failure
        std::size_t read_up_to(std::istream &in, uint8_t *buf, std::size_t n)
        {
            std::size_t got = 0;
            while (got < n)
            {
                in.read(reinterpret_cast<char *>(buf + got), static_cast<std::streamsize>(n - got));
                const std::streamsize r = in.gcount();
                if (r <= 0)
                {
                    break;
                }
                got += static_cast<std::size_t>(r);
            }
            return got;
        }

    } // namespace

    ReadStatus read_frame(std::istream &in, std::vector<uint8_t> &out, std::string &err, uint32_t max_len)
    {
        err.clear();

        std::array<uint8_t, kHeaderBytes> hdr{};
        const std::size_t hdr_got = read_up_to(in, hdr.data(), hdr.size());
        if (hdr_got == 0)
        {
            return ReadStatus::Eof;
        }
        if (hdr_got < hdr.size())
        {
            err = "unexpected EOF while reading frame header";
            return ReadStatus::Error;
        }

        const uint32_t len = decode_length(hdr);
        if (len == 0)
        {
            err = "invalid frame length: 0";
            return ReadStatus::Error;
        }
        if (len > max_len)
        {
            err = "frame length " + std::to_string(len) + " exceeds max " + std::to_string(max_len);
            return ReadStatus::Error;
        }

        out.assign(len, 0);
        if (read_up_to(in, out.data(), len) < len)
        {
            err = "unexpected EOF while reading frame payload";
            return ReadStatus::Error;
        }

        return ReadStatus::Frame;
    }

    bool write_frame(std::ostream &out, const std::string &payload, std::string &err, uint32_t max_len)
    {
        err.clear();

        // An empty payload would be indistinguishable from a bad header on
        // the reading side
        if (payload.empty())
        {
            err = "invalid frame length: 0";
            return false;
        }
        if (payload.size() > max_len)
        {
            err = "frame length exceeds max";
            return false;
        }

        const auto hdr = encode_length(static_cast<uint32_t>(payload.size()));
        out.write(reinterpret_cast<const char *>(hdr.data()), static_cast<std::streamsize>(hdr.size()));
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        out.flush();
        if (!out.good())
        {
            err = "failed writing frame";
            return false;
        }

        return true;
    }

} // namespace transport
