// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework - TCP frame I/O

#ifndef GOSSAMER_TCP_FRAMING_HPP
#define GOSSAMER_TCP_FRAMING_HPP

#include <chrono>
#include <cstddef>
#include <string>

namespace Gossamer::Core {

    constexpr size_t FRAME_HEADER_BYTES = 4;

    // Egy teljes frame beolvasásának felső határa, függetlenül az egyes read() hívásoktól.
    constexpr std::chrono::milliseconds FRAME_READ_DEADLINE{5000};

    using FrameDeadline = std::chrono::steady_clock::time_point;

    /**
     * @brief Pontosan len bájt olvasása; false ha a kapcsolat lezárult,
     * a read() hibát adott, vagy lejárt a határidő.
     */
    bool readExact(int fd, char* buffer, size_t len, FrameDeadline deadline);

    bool writeAll(int fd, const char* buffer, size_t len);

    /**
     * @brief u32 big-endian hossz + payload. A maxFrameBytes-nál hosszabb frame hiba.
     */
    bool readFrame(int fd, size_t maxFrameBytes, FrameDeadline deadline, std::string& payload);
    bool writeFrame(int fd, const std::string& payload);
}

#endif
