#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>

namespace streaming
{
    template<typename T>
    struct Admission
    {
        std::span<const T> admitted;
        std::span<const T> deferred;
    };

    // Splits an ordered candidate list at the per-frame cap, preserving order.
    // Nothing is remembered: deferred candidates are re-planned next frame.
    template<typename T>
    Admission<T> admit(std::span<const T> candidates, int32_t cap)
    {
        const size_t n = (cap > 0) ? std::min(candidates.size(), static_cast<size_t>(cap)) : size_t{0};
        return Admission<T>{candidates.first(n), candidates.subspan(n)};
    }
} // namespace streaming
