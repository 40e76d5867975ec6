#include "sandbox/log_demux.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <vector>

#include "utils/common.hpp"

namespace runbox::sandbox {
namespace {

// Keeps reading until `size` bytes arrived or the source ended.
std::size_t ReadFull(ByteSource& source, char* data, std::size_t size) {
    std::size_t total = 0;
    while (total < size) {
        const auto n = source.ReadSome(data + total, size - total);
        if (n == 0) {
            break;
        }
        total += n;
    }
    return total;
}

// Consumes `size` bytes without buffering them. Returns false on early end of stream.
bool Skip(ByteSource& source, std::size_t size) {
    std::array<char, 4096> scratch{};
    while (size > 0) {
        const auto chunk = std::min(size, scratch.size());
        const auto n = ReadFull(source, scratch.data(), chunk);
        if (n < chunk) {
            return false;
        }
        size -= n;
    }
    return true;
}

}  // namespace

std::size_t StringByteSource::ReadSome(char* data, std::size_t size) {
    const auto n = std::min(size, data_.size() - offset_);
    if (n > 0) {
        std::memcpy(data, data_.data() + offset_, n);
        offset_ += n;
    }
    return n;
}

DemuxedOutput Demultiplex(ByteSource& source) {
    std::vector<std::string> stdout_parts;
    std::vector<std::string> stderr_parts;

    std::array<char, kFrameHeaderSize> header{};
    while (true) {
        if (ReadFull(source, header.data(), header.size()) < header.size()) {
            break;
        }
        const auto stream = static_cast<unsigned char>(header[0]);
        std::uint32_t size = 0;
        for (std::size_t i = 4; i < header.size(); ++i) {
            size = (size << 8) | static_cast<unsigned char>(header[i]);
        }
        if (size == 0) {
            continue;
        }
        if (size > kMaxFrameSize) {
            if (!Skip(source, size)) {
                break;
            }
            continue;
        }

        std::string payload(size, '\0');
        if (ReadFull(source, payload.data(), size) < size) {
            break;
        }
        if (!payload.empty() && payload.back() == '\n') {
            payload.pop_back();
        }
        if (stream == 1) {
            stdout_parts.push_back(std::move(payload));
        } else if (stream == 2) {
            stderr_parts.push_back(std::move(payload));
        }
    }

    return DemuxedOutput{utils::Join(stdout_parts, "\n"), utils::Join(stderr_parts, "\n")};
}

DemuxedOutput DemultiplexBuffer(std::string_view data) {
    StringByteSource source(data);
    return Demultiplex(source);
}

}  // namespace runbox::sandbox
