#pragma once
#include <chroma/color/color.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chroma::io {

// Big-endian byte buffer. Colors are stored as their hex string, so a value
// read back is quantized to 8 bits per channel.
class Serializer {
public:
    void write_u8(uint8_t value);
    void write_u32(uint32_t value);
    void write_f32(float value);
    void write_string(std::string_view str);
    void write_color(const Color& color);

    const std::vector<uint8_t>& data() const { return buffer_; }
    std::vector<uint8_t> take_data() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

class Deserializer {
public:
    explicit Deserializer(const uint8_t* data, size_t size);
    explicit Deserializer(const std::vector<uint8_t>& data);

    uint8_t read_u8();
    uint32_t read_u32();
    float read_f32();
    std::string read_string();
    // Throws css::ParseColorError when the stored string is not a color.
    Color read_color();

    bool has_remaining() const;
    size_t remaining() const;

private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;

    void check_remaining(size_t needed) const;
};

} // namespace chroma::io
