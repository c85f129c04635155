#pragma once

#include <Lumen/common.hpp>
#include <Lumen/misc/log.hpp>

namespace vga {
    constexpr uintptr_t fb_pa = 0xB8000;
    constexpr size_t buffer_width = 80;
    constexpr size_t buffer_height = 25;

    // Rendered as a reverse-video block by the hardware font
    constexpr uint8_t placeholder_glyph = 0xFE;

    enum class Color : uint8_t {
        Black = 0,
        Blue = 1,
        Green = 2,
        Cyan = 3,
        Red = 4,
        Magenta = 5,
        Brown = 6,
        LightGray = 7,
        DarkGray = 8,
        LightBlue = 9,
        LightGreen = 10,
        LightCyan = 11,
        LightRed = 12,
        Pink = 13,
        Yellow = 14,
        White = 15
    };

    struct ColorCode {
        constexpr ColorCode(Color foreground, Color background): code{(uint8_t)(((uint8_t)background << 4) | (uint8_t)foreground)} {}

        constexpr Color foreground() const { return (Color)(code & 0xF); }
        constexpr Color background() const { return (Color)(code >> 4); }

        constexpr bool operator==(const ColorCode&) const = default;

        uint8_t code;
    };
    static_assert(sizeof(ColorCode) == 1);

    constexpr ColorCode default_color{Color::Yellow, Color::Black};

    struct ScreenChar {
        uint8_t ascii_character;
        ColorCode color_code;

        constexpr bool operator==(const ScreenChar&) const = default;
    };
    static_assert(sizeof(ScreenChar) == 2);
    static_assert(offsetof(ScreenChar, ascii_character) == 0);
    static_assert(offsetof(ScreenChar, color_code) == 1);

    // Character byte in the low half, attribute byte in the high half
    struct Buffer {
        ScreenChar read(size_t row, size_t col) const {
            uint16_t v = cells[row][col];
            auto attr = (uint8_t)(v >> 8);

            return {(uint8_t)(v & 0xFF), ColorCode{(Color)(attr & 0xF), (Color)(attr >> 4)}};
        }

        void write(size_t row, size_t col, ScreenChar c) {
            cells[row][col] = (uint16_t)(c.ascii_character | (c.color_code.code << 8));
        }

        volatile uint16_t cells[buffer_height][buffer_width];
    };
    static_assert(sizeof(Buffer) == buffer_width * buffer_height * sizeof(uint16_t));

    // Returns the buffer at fb_pa on the first call only, nullptr afterwards
    Buffer* acquire_buffer();

    struct Writer final : public klog::Logger {
        Writer(Buffer& buffer, ColorCode color = default_color): _column{0}, _color{color}, _buffer{&buffer} {}

        Writer(const Writer&) = delete;
        Writer& operator=(const Writer&) = delete;

        void putc(const char c) override;

        void write_byte(uint8_t byte);
        void write_string(const char* str);
        void write_string(const char* str, size_t len);

        void new_line();
        void clear_row(size_t row);

        size_t column_position() const { return _column; }
        ColorCode color_code() const { return _color; }
        Buffer& buffer() { return *_buffer; }

        private:
        size_t _column;
        ColorCode _color;
        Buffer* _buffer;
    };
} // namespace vga
