// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework - TCP frame I/O

#include "core/TcpFraming.hpp"

#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>

namespace Gossamer::Core {

    bool readExact(int fd, char* buffer, size_t len, FrameDeadline deadline) {
        size_t done = 0;
        while (done < len) {
            // Csöpögtetett frame sem tarthatja fel a listener szálat.
            if (std::chrono::steady_clock::now() >= deadline) return false;

            ssize_t n = read(fd, buffer + done, len - done);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) return false;
            done += static_cast<size_t>(n);
        }
        return true;
    }

    bool writeAll(int fd, const char* buffer, size_t len) {
        size_t done = 0;
        while (done < len) {
            ssize_t n = send(fd, buffer + done, len - done, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) return false;
            done += static_cast<size_t>(n);
        }
        return true;
    }

    bool readFrame(int fd, size_t maxFrameBytes, FrameDeadline deadline, std::string& payload) {
        unsigned char header[FRAME_HEADER_BYTES];
        if (!readExact(fd, reinterpret_cast<char*>(header), sizeof(header), deadline)) {
            return false;
        }

        uint32_t length = (static_cast<uint32_t>(header[0]) << 24) |
                          (static_cast<uint32_t>(header[1]) << 16) |
                          (static_cast<uint32_t>(header[2]) << 8) |
                          static_cast<uint32_t>(header[3]);
        if (length > maxFrameBytes) {
            return false;
        }

        payload.resize(length);
        return length == 0 || readExact(fd, &payload[0], length, deadline);
    }

    bool writeFrame(int fd, const std::string& payload) {
        uint32_t length = static_cast<uint32_t>(payload.size());
        unsigned char header[FRAME_HEADER_BYTES] = {
            static_cast<unsigned char>(length >> 24),
            static_cast<unsigned char>(length >> 16),
            static_cast<unsigned char>(length >> 8),
            static_cast<unsigned char>(length)
        };

        return writeAll(fd, reinterpret_cast<const char*>(header), sizeof(header)) &&
               writeAll(fd, payload.data(), payload.size());
    }
}
