// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#include "membership/WireCodec.hpp"

#include <utility>
#include <vector>

namespace Gossamer::Membership {

    // --- Encoder ---

    void Encoder::putU32(uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            putU8(static_cast<uint8_t>(v >> (8 * i)));
        }
    }

    void Encoder::putU64(uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            putU8(static_cast<uint8_t>(v >> (8 * i)));
        }
    }

    // A dekóder ugyanezeket a korlátokat ellenőrzi; amit nem tudna visszaolvasni, ki sem írjuk.
    void Encoder::putString(const std::string& s) {
        if (s.size() > MAX_STRING_BYTES) {
            throw CodecError("string length " + std::to_string(s.size()) + " exceeds limit");
        }
        putU64(s.size());
        buffer.append(s);
    }

    void Encoder::putHash(const Hash& h) {
        buffer.append(reinterpret_cast<const char*>(h.bytes.data()), h.bytes.size());
    }

    void Encoder::putOptionalHash(const std::optional<Hash>& h) {
        if (h) {
            putU8(1);
            putHash(*h);
        } else {
            putU8(0);
        }
    }

    void Encoder::putObservation(const Observation& obs) {
        putU8(static_cast<uint8_t>(obs.kind));
        switch (obs.kind) {
            case ObservationKind::GENESIS:
                if (obs.subject) {
                    throw CodecError("GENESIS observation with a subject");
                }
                if (obs.genesis.size() > MAX_GENESIS_NODES) {
                    throw CodecError("genesis group of " + std::to_string(obs.genesis.size()) +
                                     " nodes exceeds limit");
                }
                // std::set: rendezett, tehát kanonikus
                putU64(obs.genesis.size());
                for (const auto& node : obs.genesis) {
                    putNodeId(node);
                }
                break;
            case ObservationKind::ADD:
            case ObservationKind::REMOVE:
                if (!obs.subject) {
                    throw CodecError(std::string(toString(obs.kind)) + " observation without subject");
                }
                if (!obs.genesis.empty()) {
                    throw CodecError(std::string(toString(obs.kind)) + " observation with a genesis group");
                }
                putNodeId(*obs.subject);
                break;
            case ObservationKind::SYNC:
                if (obs.subject || !obs.genesis.empty()) {
                    throw CodecError("SYNC observation with payload");
                }
                break;
        }
    }

    void Encoder::putEvent(const Event& event) {
        putNodeId(event.creator);
        putOptionalHash(event.selfParent);
        putOptionalHash(event.otherParent);
        putObservation(event.observation);
    }

    // --- Decoder ---

    void Decoder::require(size_t n) const {
        if (remaining() < n) {
            throw CodecError("truncated input: need " + std::to_string(n) +
                             " bytes at offset " + std::to_string(offset) +
                             ", have " + std::to_string(remaining()));
        }
    }

    uint8_t Decoder::getU8() {
        require(1);
        return static_cast<uint8_t>(data[offset++]);
    }

    uint32_t Decoder::getU32() {
        require(4);
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<uint32_t>(static_cast<uint8_t>(data[offset++])) << (8 * i);
        }
        return v;
    }

    uint64_t Decoder::getU64() {
        require(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v |= static_cast<uint64_t>(static_cast<uint8_t>(data[offset++])) << (8 * i);
        }
        return v;
    }

    std::string Decoder::getString() {
        uint64_t len = getU64();
        if (len > MAX_STRING_BYTES) {
            throw CodecError("string length " + std::to_string(len) + " exceeds limit");
        }
        require(static_cast<size_t>(len));
        std::string s = data.substr(offset, static_cast<size_t>(len));
        offset += static_cast<size_t>(len);
        return s;
    }

    Hash Decoder::getHash() {
        require(Hash::SIZE);
        Hash h;
        for (size_t i = 0; i < Hash::SIZE; ++i) {
            h.bytes[i] = static_cast<uint8_t>(data[offset++]);
        }
        return h;
    }

    std::optional<Hash> Decoder::getOptionalHash() {
        uint8_t flag = getU8();
        if (flag == 0) return std::nullopt;
        if (flag != 1) {
            throw CodecError("invalid option flag " + std::to_string(flag));
        }
        return getHash();
    }

    NodeId Decoder::getNodeId() {
        std::string raw = getString();
        if (raw.empty()) {
            throw CodecError("empty node id");
        }
        return NodeId(std::move(raw));
    }

    Observation Decoder::getObservation() {
        uint8_t raw = getU8();
        switch (static_cast<ObservationKind>(raw)) {
            case ObservationKind::GENESIS: {
                uint64_t count = getU64();
                if (count > MAX_GENESIS_NODES) {
                    throw CodecError("genesis group of " + std::to_string(count) + " nodes exceeds limit");
                }
                std::set<NodeId> group;
                for (uint64_t i = 0; i < count; ++i) {
                    group.insert(getNodeId());
                }
                if (group.size() != count) {
                    throw CodecError("duplicate node in genesis group");
                }
                return Observation::makeGenesis(std::move(group));
            }
            case ObservationKind::ADD:
                return Observation::makeAdd(getNodeId());
            case ObservationKind::REMOVE:
                return Observation::makeRemove(getNodeId());
            case ObservationKind::SYNC:
                return Observation::makeSync();
        }
        throw CodecError("unknown observation kind " + std::to_string(raw));
    }

    Event Decoder::getEvent() {
        NodeId creator = getNodeId();
        std::optional<Hash> selfParent = getOptionalHash();
        std::optional<Hash> otherParent = getOptionalHash();
        Observation observation = getObservation();
        return Event{std::move(creator), selfParent, otherParent, std::move(observation)};
    }

    // --- Free functions ---

    std::string encodeEvent(const Event& event) {
        Encoder enc;
        enc.putEvent(event);
        return enc.release();
    }

    Event decodeEvent(const std::string& bytes) {
        Decoder dec(bytes);
        Event event = dec.getEvent();
        if (!dec.atEnd()) {
            throw CodecError(std::to_string(dec.remaining()) + " trailing bytes after event");
        }
        return event;
    }

    std::string encodeMessage(const Message& message) {
        Encoder enc;
        enc.putU8(WIRE_VERSION);
        enc.putU8(static_cast<uint8_t>(message.kind));
        enc.putNodeId(message.sender);
        switch (message.kind) {
            case MessageKind::EVENT:
                if (message.events.size() != 1) {
                    throw CodecError("EVENT message must carry exactly one event");
                }
                enc.putEvent(message.events.front());
                break;
            case MessageKind::BATCH:
                if (message.events.size() > MAX_BATCH_EVENTS) {
                    throw CodecError("batch of " + std::to_string(message.events.size()) +
                                     " events exceeds limit");
                }
                enc.putU64(message.events.size());
                for (const auto& event : message.events) {
                    enc.putEvent(event);
                }
                break;
            case MessageKind::HEARTBEAT:
                break;
        }
        return enc.release();
    }

    Message decodeMessage(const std::string& bytes) {
        Decoder dec(bytes);

        uint8_t version = dec.getU8();
        if (version != WIRE_VERSION) {
            throw CodecError("unsupported wire version " + std::to_string(version));
        }

        uint8_t rawKind = dec.getU8();
        NodeId sender = dec.getNodeId();

        std::vector<Event> events;
        MessageKind kind = MessageKind::HEARTBEAT;
        switch (static_cast<MessageKind>(rawKind)) {
            case MessageKind::EVENT:
                kind = MessageKind::EVENT;
                events.push_back(dec.getEvent());
                break;
            case MessageKind::BATCH: {
                kind = MessageKind::BATCH;
                uint64_t count = dec.getU64();
                if (count > MAX_BATCH_EVENTS) {
                    throw CodecError("batch of " + std::to_string(count) + " events exceeds limit");
                }
                for (uint64_t i = 0; i < count; ++i) {
                    events.push_back(dec.getEvent());
                }
                break;
            }
            case MessageKind::HEARTBEAT:
                kind = MessageKind::HEARTBEAT;
                break;
            default:
                throw CodecError("unknown message kind " + std::to_string(rawKind));
        }

        if (!dec.atEnd()) {
            throw CodecError(std::to_string(dec.remaining()) + " trailing bytes after message");
        }
        return Message{kind, std::move(sender), std::move(events)};
    }

    Hash hashEvent(const Event& event) {
        return computeHash(encodeEvent(event));
    }

} // namespace Gossamer::Membership
