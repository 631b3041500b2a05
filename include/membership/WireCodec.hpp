// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework
// Canonical binary encoding (little-endian, length-prefixed)

#ifndef GOSSAMER_WIRE_CODEC_HPP
#define GOSSAMER_WIRE_CODEC_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "membership/Event.hpp"
#include "membership/Message.hpp"

namespace Gossamer::Membership {

    constexpr uint8_t WIRE_VERSION = 1;
    constexpr uint64_t MAX_STRING_BYTES = 4096;
    constexpr uint64_t MAX_GENESIS_NODES = 4096;
    constexpr uint64_t MAX_BATCH_EVENTS = 65536;

    class CodecError : public std::runtime_error {
    public:
        explicit CodecError(const std::string& what)
            : std::runtime_error("Codec error: " + what) {}
    };

    class Encoder {
    public:
        void putU8(uint8_t v) { buffer.push_back(static_cast<char>(v)); }
        void putU32(uint32_t v);
        void putU64(uint64_t v);
        void putString(const std::string& s);
        void putHash(const Hash& h);
        void putOptionalHash(const std::optional<Hash>& h);
        void putNodeId(const NodeId& id) { putString(id.str()); }
        void putObservation(const Observation& obs);
        void putEvent(const Event& event);

        const std::string& bytes() const { return buffer; }
        std::string release() { return std::move(buffer); }

    private:
        std::string buffer;
    };

    class Decoder {
    public:
        explicit Decoder(const std::string& data) : data(data) {}

        uint8_t getU8();
        uint32_t getU32();
        uint64_t getU64();
        std::string getString();
        Hash getHash();
        std::optional<Hash> getOptionalHash();
        NodeId getNodeId();
        Observation getObservation();
        Event getEvent();

        bool atEnd() const { return offset == data.size(); }
        size_t remaining() const { return data.size() - offset; }

    private:
        const std::string& data;
        size_t offset = 0;

        void require(size_t n) const;
    };

    // Az esemény kanonikus alakja; ebből számoljuk a hash-t.
    std::string encodeEvent(const Event& event);
    Event decodeEvent(const std::string& bytes);

    std::string encodeMessage(const Message& message);
    Message decodeMessage(const std::string& bytes);

    // computeHash(encodeEvent(event))
    Hash hashEvent(const Event& event);

} // namespace Gossamer::Membership

#endif // GOSSAMER_WIRE_CODEC_HPP
