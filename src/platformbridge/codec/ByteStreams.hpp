#pragma once
#include "core/Error.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace PB {

// Little-endian writer appending to an owned byte vector. Alignment is
// relative to the start of the vector.
class ByteWriter {
public:
    auto writeByte(std::uint8_t byte) -> void;
    auto writeUint16(std::uint16_t value) -> void;
    auto writeUint32(std::uint32_t value) -> void;
    auto writeInt32(std::int32_t value) -> void;
    auto writeInt64(std::int64_t value) -> void;
    auto writeFloat32(float value) -> void;
    auto writeFloat64(double value) -> void;
    auto writeBytes(std::span<std::uint8_t const> bytes) -> void;
    // Zero-pads until the write position is a multiple of alignment.
    auto writeAlignment(std::size_t alignment) -> void;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return data_.size(); }
    [[nodiscard]] auto take() -> std::vector<std::uint8_t>;

private:
    std::vector<std::uint8_t> data_;
};

// Bounds-checked little-endian reader over a borrowed buffer. Every read past
// the end fails with Error::Code::Malformed and leaves the position unchanged.
class ByteReader {
public:
    explicit ByteReader(std::span<std::uint8_t const> bytes) noexcept : bytes_(bytes) {}

    [[nodiscard]] auto readByte() -> Expected<std::uint8_t>;
    [[nodiscard]] auto readUint16() -> Expected<std::uint16_t>;
    [[nodiscard]] auto readUint32() -> Expected<std::uint32_t>;
    [[nodiscard]] auto readInt32() -> Expected<std::int32_t>;
    [[nodiscard]] auto readInt64() -> Expected<std::int64_t>;
    [[nodiscard]] auto readFloat32() -> Expected<float>;
    [[nodiscard]] auto readFloat64() -> Expected<double>;
    [[nodiscard]] auto readBytes(std::size_t count) -> Expected<std::span<std::uint8_t const>>;
    [[nodiscard]] auto readAlignment(std::size_t alignment) -> Expected<void>;

    [[nodiscard]] auto position() const noexcept -> std::size_t { return position_; }
    [[nodiscard]] auto remaining() const noexcept -> std::size_t { return bytes_.size() - position_; }
    [[nodiscard]] auto atEnd() const noexcept -> bool { return position_ >= bytes_.size(); }

private:
    [[nodiscard]] auto readLittleEndian(std::size_t width) -> Expected<std::uint64_t>;

    std::span<std::uint8_t const> bytes_;
    std::size_t                   position_ = 0;
};

} // namespace PB
