#pragma once

#include <Lumen/common.hpp>
#include <Lumen/cpu/pio.hpp>

#include <Lumen/misc/log.hpp>

namespace e9 {
    constexpr uint16_t port_addr = 0xe9;
    constexpr uint16_t expected_value = 0xe9;

    // Bochs and QEMU read back port_addr from the port, hardware floats the bus
    constexpr bool is_present(uint8_t value) {
        return value == expected_value;
    }

    // True if the emulator exposes the debug port
    bool init();

    struct Writer final : public klog::Logger {
        void putc(const char c) override;
    };
} // namespace e9
