#include <chroma/io/serializer.h>
#include <chroma/css/parser.h>

#include <cstring>
#include <stdexcept>

namespace chroma::io {

// ---------------------------------------------------------------------------
// Serializer
// ---------------------------------------------------------------------------

void Serializer::write_u8(uint8_t value) {
    buffer_.push_back(value);
}

void Serializer::write_u32(uint32_t value) {
    buffer_.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    buffer_.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buffer_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer_.push_back(static_cast<uint8_t>(value & 0xFF));
}

void Serializer::write_f32(float value) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    write_u32(bits);
}

void Serializer::write_string(std::string_view str) {
    write_u32(static_cast<uint32_t>(str.size()));
    buffer_.insert(buffer_.end(), str.begin(), str.end());
}

void Serializer::write_color(const Color& color) {
    write_string(color.to_hex_string());
}

// ---------------------------------------------------------------------------
// Deserializer
// ---------------------------------------------------------------------------

Deserializer::Deserializer(const uint8_t* data, size_t size)
    : data_(data), size_(size) {}

Deserializer::Deserializer(const std::vector<uint8_t>& data)
    : data_(data.data()), size_(data.size()) {}

void Deserializer::check_remaining(size_t needed) const {
    if (offset_ + needed > size_) {
        throw std::runtime_error(
            "Deserializer: not enough data (need " + std::to_string(needed) +
            " bytes, have " + std::to_string(size_ - offset_) + ")");
    }
}

uint8_t Deserializer::read_u8() {
    check_remaining(1);
    return data_[offset_++];
}

uint32_t Deserializer::read_u32() {
    check_remaining(4);
    uint32_t value = (static_cast<uint32_t>(data_[offset_]) << 24) |
                     (static_cast<uint32_t>(data_[offset_ + 1]) << 16) |
                     (static_cast<uint32_t>(data_[offset_ + 2]) << 8) |
                     static_cast<uint32_t>(data_[offset_ + 3]);
    offset_ += 4;
    return value;
}

float Deserializer::read_f32() {
    uint32_t bits = read_u32();
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

std::string Deserializer::read_string() {
    uint32_t len = read_u32();
    check_remaining(len);
    std::string result(reinterpret_cast<const char*>(data_ + offset_), len);
    offset_ += len;
    return result;
}

Color Deserializer::read_color() {
    return css::from_html(read_string());
}

bool Deserializer::has_remaining() const {
    return offset_ < size_;
}

size_t Deserializer::remaining() const {
    return size_ - offset_;
}

} // namespace chroma::io
