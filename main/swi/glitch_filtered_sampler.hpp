#ifndef GLITCH_FILTERED_SAMPLER_HPP
#define GLITCH_FILTERED_SAMPLER_HPP

#include <cstdint>
#include <main/swi/register_port.hpp>
#include <main/swi/swi_timing.hpp>

namespace Swi {
    // Polls bit 0 of the port for a sustained level. The level counts as found
    // once timing.glitch_filter_length consecutive samples match; one sample
    // at the other level throws away the run, so glitches shorter than the
    // filter can never be accepted.
    //
    // desired_level: only bit 0 is used (0 = low, 1 = high).
    // timeout_iterations: number of samples before giving up; must be >= 1.
    // Returns true if found, false once the full budget has been sampled.
    //
    // Port needs read(); see RegisterPort. Same interrupt/IRAM requirements
    // as sendToken().
    template <typename Port>
    SWI_ALWAYS_INLINE bool lookForBit(Port& port, uint32_t desired_level,
                                      uint32_t timeout_iterations, const TimingConstants& timing) {
        // hit == 1 when the sample equals the wanted level
        const uint32_t miss_level = (desired_level & line_mask) ^ 1u;
        const uint32_t filter_length = timing.glitch_filter_length;
        uint32_t matches = 0;
        do {
            const uint32_t hit = (port.read() & line_mask) ^ miss_level;
            // Branch-free so every pass costs the same: a miss clears the
            // run, a hit extends it.
            matches = (matches & (0u - hit)) + hit;
            if (matches == filter_length) {
                return true;
            }
        } while (--timeout_iterations != 0);
        return false;
    }
}

#endif // GLITCH_FILTERED_SAMPLER_HPP
