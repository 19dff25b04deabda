#pragma once

#include <string>
#include <chrono>
#include <cstdint>

// Human-readable size in the style of `du -h`: "0B", "512B", "1.0K", "4.5M", "12G".
// Base 1024, rounded up; one decimal below 10 units, none at or above.
std::string format_size(uint64_t bytes);

// Elapsed wall time: "850ms", "3.2s", "2m5s".
std::string format_elapsed(std::chrono::milliseconds elapsed);
