#include "codec/ByteStreams.hpp"

#include <bit>
#include <string>

namespace PB {
namespace {

auto truncated(std::size_t wanted, std::size_t available) -> Error {
    return Error{Error::Code::Malformed,
                 "buffer truncated: needed " + std::to_string(wanted) + " bytes, "
                         + std::to_string(available) + " remaining"};
}

} // namespace

auto ByteWriter::writeByte(std::uint8_t byte) -> void {
    this->data_.push_back(byte);
}

auto ByteWriter::writeUint16(std::uint16_t value) -> void {
    auto& out = this->data_;
    out.push_back(static_cast<std::uint8_t>(value & 0xFFU));
    out.push_back(static_cast<std::uint8_t>((value >> 8U) & 0xFFU));
}

auto ByteWriter::writeUint32(std::uint32_t value) -> void {
    auto& out = this->data_;
    for (unsigned shift = 0; shift < 32U; shift += 8U) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFU));
    }
}

auto ByteWriter::writeInt32(std::int32_t value) -> void {
    this->writeUint32(static_cast<std::uint32_t>(value));
}

auto ByteWriter::writeInt64(std::int64_t value) -> void {
    auto& out  = this->data_;
    auto  bits = static_cast<std::uint64_t>(value);
    for (unsigned shift = 0; shift < 64U; shift += 8U) {
        out.push_back(static_cast<std::uint8_t>((bits >> shift) & 0xFFU));
    }
}

auto ByteWriter::writeFloat32(float value) -> void {
    this->writeUint32(std::bit_cast<std::uint32_t>(value));
}

auto ByteWriter::writeFloat64(double value) -> void {
    this->writeInt64(std::bit_cast<std::int64_t>(value));
}

auto ByteWriter::writeBytes(std::span<std::uint8_t const> bytes) -> void {
    auto& out = this->data_;
    out.insert(out.end(), bytes.begin(), bytes.end());
}

auto ByteWriter::writeAlignment(std::size_t alignment) -> void {
    auto& out = this->data_;
    if (alignment == 0) {
        return;
    }
    auto const mod = out.size() % alignment;
    if (mod != 0) {
        out.insert(out.end(), alignment - mod, std::uint8_t{0});
    }
}

auto ByteWriter::take() -> std::vector<std::uint8_t> {
    auto result = std::move(this->data_);
    this->data_.clear();
    return result;
}

auto ByteReader::readLittleEndian(std::size_t width) -> Expected<std::uint64_t> {
    if (this->remaining() < width) {
        return std::unexpected(truncated(width, this->remaining()));
    }
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        value |= static_cast<std::uint64_t>(this->bytes_[this->position_ + i]) << (8U * i);
    }
    this->position_ += width;
    return value;
}

auto ByteReader::readByte() -> Expected<std::uint8_t> {
    if (this->atEnd()) {
        return std::unexpected(truncated(1, 0));
    }
    return this->bytes_[this->position_++];
}

auto ByteReader::readUint16() -> Expected<std::uint16_t> {
    auto raw = this->readLittleEndian(2);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    return static_cast<std::uint16_t>(*raw);
}

auto ByteReader::readUint32() -> Expected<std::uint32_t> {
    auto raw = this->readLittleEndian(4);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    return static_cast<std::uint32_t>(*raw);
}

auto ByteReader::readInt32() -> Expected<std::int32_t> {
    auto raw = this->readLittleEndian(4);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    return static_cast<std::int32_t>(static_cast<std::uint32_t>(*raw));
}

auto ByteReader::readInt64() -> Expected<std::int64_t> {
    auto raw = this->readLittleEndian(8);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    return static_cast<std::int64_t>(*raw);
}

auto ByteReader::readFloat32() -> Expected<float> {
    auto raw = this->readLittleEndian(4);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    return std::bit_cast<float>(static_cast<std::uint32_t>(*raw));
}

auto ByteReader::readFloat64() -> Expected<double> {
    auto raw = this->readLittleEndian(8);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    return std::bit_cast<double>(*raw);
}

auto ByteReader::readBytes(std::size_t count) -> Expected<std::span<std::uint8_t const>> {
    if (this->remaining() < count) {
        return std::unexpected(truncated(count, this->remaining()));
    }
    auto view = this->bytes_.subspan(this->position_, count);
    this->position_ += count;
    return view;
}

auto ByteReader::readAlignment(std::size_t alignment) -> Expected<void> {
    if (alignment == 0) {
        return {};
    }
    auto const mod = this->position_ % alignment;
    if (mod == 0) {
        return {};
    }
    auto const padding = alignment - mod;
    if (this->remaining() < padding) {
        return std::unexpected(truncated(padding, this->remaining()));
    }
    this->position_ += padding;
    return {};
}

} // namespace PB
