#include <Lumen/drivers/vga.hpp>

// Identity mapped until the hosting kernel moves the direct map
uintptr_t phys_mem_map = 0;

static constinit bool buffer_taken = false;

vga::Buffer* vga::acquire_buffer() {
    if(__atomic_exchange_n(&buffer_taken, true, __ATOMIC_SEQ_CST))
        return nullptr;

    return (Buffer*)(fb_pa + phys_mem_map);
}

static uint8_t sanitize(uint8_t byte) {
    if((byte >= 0x20 && byte <= 0x7E) || byte == '\n')
        return byte;

    return vga::placeholder_glyph;
}

void vga::Writer::putc(const char c) {
    write_byte(sanitize((uint8_t)c));
}

void vga::Writer::write_byte(uint8_t byte) {
    if(byte == '\n') {
        new_line();
        return;
    }

    if(_column >= buffer_width)
        new_line();

    _buffer->write(buffer_height - 1, _column, ScreenChar{byte, _color});
    _column++;
}

void vga::Writer::write_string(const char* str) {
    while(*str)
        write_byte(sanitize((uint8_t)*str++));
}

void vga::Writer::write_string(const char* str, size_t len) {
    for(size_t i = 0; i < len; i++)
        write_byte(sanitize((uint8_t)str[i]));
}

void vga::Writer::new_line() {
    // Forward pass, row i is read before anything overwrites it
    for(size_t row = 1; row < buffer_height; row++)
        for(size_t col = 0; col < buffer_width; col++)
            _buffer->write(row - 1, col, _buffer->read(row, col));

    clear_row(buffer_height - 1);
    _column = 0;
}

void vga::Writer::clear_row(size_t row) {
    const ScreenChar blank{' ', _color};

    for(size_t col = 0; col < buffer_width; col++)
        _buffer->write(row, col, blank);
}
