#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace runbox::sandbox {

inline constexpr std::size_t kFrameHeaderSize = 8;
inline constexpr std::uint32_t kMaxFrameSize = 10 * 1024 * 1024;

// Minimal pull interface over a byte stream. ReadSome may return fewer bytes than
// requested; zero means end of stream.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual std::size_t ReadSome(char* data, std::size_t size) = 0;
};

class StringByteSource : public ByteSource {
public:
    explicit StringByteSource(std::string_view data) : data_(data) {}

    std::size_t ReadSome(char* data, std::size_t size) override;

private:
    std::string_view data_;
    std::size_t offset_ = 0;
};

struct DemuxedOutput {
    std::string stdout_text;
    std::string stderr_text;
};

// Splits a multiplexed container stream. Each frame is
// [stream:1][reserved:3][length:4, big endian][payload], stream 1 = stdout,
// 2 = stderr, anything else is dropped. Stops without error at a short header or
// truncated payload. Frames larger than kMaxFrameSize (or empty) are skipped.
// One trailing newline per frame is removed; frames are joined with "\n".
DemuxedOutput Demultiplex(ByteSource& source);

DemuxedOutput DemultiplexBuffer(std::string_view data);

}  // namespace runbox::sandbox
