#include <Lumen/misc/log.hpp>

#include <Lumen/drivers/e9.hpp>
#include <Lumen/drivers/vga.hpp>

#include <stdx/utility.hpp>

klog::Logger* klog::global_logger;
constinit TicketLock klog::global_lock;

static constinit stdx::lazy_initializer<vga::Writer> vga_logger;
static constinit stdx::lazy_initializer<e9::Writer> debug_logger;

namespace {
    struct NullWriter final : public klog::Logger {
        void putc(const char) override {}
    };
}

static NullWriter null_logger;

static klog::Logger* get_logger(klog::LoggerType type) {
    switch (type) {
        case klog::LoggerType::Vga:
            if(!vga_logger) {
                auto* buffer = vga::acquire_buffer();
                if(!buffer)
                    return nullptr;

                vga_logger.init(*buffer, vga::default_color);
            }

            return vga_logger.get();
        case klog::LoggerType::Debug:
            if(!debug_logger) {
                if(!e9::init())
                    return nullptr;

                debug_logger.init();
            }

            return debug_logger.get();
    }

    return nullptr;
}

void klog::select_logger(klog::LoggerType type) {
    klog::Logger* logger;
    {
        stdx::lock_guard guard{global_lock};

        logger = get_logger(type);
        if(logger)
            global_logger = logger;
    }

    if(!logger)
        PANIC("log: requested logger is not available");
}

klog::Logger& klog::current_logger() {
    if(!global_logger) {
        global_logger = get_logger(LoggerType::Vga);

        // The text buffer was handed out before any print, fall back to the debug port
        if(!global_logger)
            global_logger = get_logger(LoggerType::Debug);

        if(!global_logger)
            global_logger = &null_logger;
    }

    return *global_logger;
}
