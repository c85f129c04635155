#include <Lumen/drivers/e9.hpp>

bool e9::init() {
    return is_present(pio::inb(port_addr));
}

void e9::Writer::putc(const char c) {
    pio::outb(port_addr, c);
}
