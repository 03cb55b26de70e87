#ifndef BIT_TRANSMITTER_HPP
#define BIT_TRANSMITTER_HPP

#include <cstdint>
#include <main/swi/register_port.hpp>
#include <main/swi/swi_timing.hpp>

namespace Swi {
    // Sends one token by bit-banging bit 0 of the port, least-significant bit
    // first. Each bit is held for timing.delay_iterations passes of
    // Port::hold(), which together with the loop overhead makes one bit period.
    //
    // Port needs writeLevel(uint32_t) and hold(uint32_t); see RegisterPort.
    //
    // bit_count must be 1..32: the loop writes before it counts, so 0 wraps
    // around to 2^32 bits. Bits of token above bit_count are never sent.
    //
    // Interrupts must be masked and the caller must run from IRAM for the
    // whole call, otherwise any stall ends up in a pulse width.
    template <typename Port>
    SWI_ALWAYS_INLINE void sendToken(Port& port, uint32_t token, uint32_t bit_count,
                                     const TimingConstants& timing) {
        const uint32_t delay_iterations = timing.delay_iterations;
        do {
            port.writeLevel(token);
            port.hold(delay_iterations);
            token >>= 1;
        } while (--bit_count != 0);
    }
}

#endif // BIT_TRANSMITTER_HPP
