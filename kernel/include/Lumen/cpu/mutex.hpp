#pragma once

// This file is included from <Lumen/misc/log.hpp> so do stdint.h
#include <stdint.h>

struct TicketLock {
    constexpr TicketLock(): serving{0}, next_ticket{0} {}

    void lock() {
        auto ticket = __atomic_fetch_add(&next_ticket, 1, __ATOMIC_SEQ_CST);
        while(__atomic_load_n(&serving, __ATOMIC_SEQ_CST) != ticket)
            asm volatile("pause");
    }

    bool try_lock() {
        auto ticket = __atomic_load_n(&next_ticket, __ATOMIC_SEQ_CST);
        if(__atomic_load_n(&serving, __ATOMIC_SEQ_CST) != ticket)
            return false;

        return __atomic_compare_exchange_n(&next_ticket, &ticket, ticket + 1, false, __ATOMIC_SEQ_CST, __ATOMIC_SEQ_CST);
    }

    void unlock() {
        __atomic_add_fetch(&serving, 1, __ATOMIC_SEQ_CST);
    }

    private:
    volatile uint64_t serving;
    volatile uint64_t next_ticket;
};
