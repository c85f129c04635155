#pragma once

#include <stdint.h>
#include <stddef.h>

#include <Lumen/misc/misc.hpp>

#define PANIC(msg) panic(__FILE__, __PRETTY_FUNCTION__, __LINE__, msg)

// Base of the direct map of physical memory, the hosting kernel updates it when it remaps
extern uintptr_t phys_mem_map;
