#ifndef REGISTER_PORT_HPP
#define REGISTER_PORT_HPP

#include <cstdint>

// Hot-path helpers must be expanded into their (IRAM) caller
#define SWI_ALWAYS_INLINE inline __attribute__((always_inline))

namespace Swi {
    // Bit 0 of the port register is the single-wire line
    static constexpr uint32_t line_mask = 1u;

    // Memory-mapped GPIO register. Only bit 0 is ever modified; every other
    // bit belongs to unrelated pins and is written back unchanged.
    class RegisterPort {
    public:
        explicit RegisterPort(volatile uint32_t* reg) : reg_(reg) {}

        SWI_ALWAYS_INLINE uint32_t read() const {
            return *reg_;
        }

        // {*reg = (*reg & ~1) | (level & 1);}
        SWI_ALWAYS_INLINE void writeLevel(uint32_t level) {
            uint32_t value = *reg_;
            value &= ~line_mask;
            value |= (level & line_mask);
            *reg_ = value;
        }

        // Busy-wait for a fixed number of loop passes. iterations must be >= 1.
        // The per-pass cycle cost is LoopCosts::delay_iteration_cycles and has
        // to be re-measured when this loop or the CPU changes.
        static SWI_ALWAYS_INLINE void hold(uint32_t iterations) {
#if defined(__XTENSA__) || defined(__riscv)
            __asm__ __volatile__(
                "1:\n"
                "    addi  %0, %0, -1\n"
                "    bnez  %0, 1b\n"
                : "+r"(iterations));
#else
            volatile uint32_t remaining = iterations;
            do {
                remaining = remaining - 1;
            } while (remaining != 0);
#endif
        }

        volatile uint32_t* address() const {
            return reg_;
        }

    private:
        volatile uint32_t* reg_;
    };
}

#endif // REGISTER_PORT_HPP
