// Timing table for the single-wire interface, derived from the CPU clock and
// the cycle cost of the bit-bang loops on the target CPU.
#ifndef SWI_TIMING_HPP
#define SWI_TIMING_HPP

#include <cstdint>

namespace Swi {
    // Protocol timing (fixed by the secure element)
    static constexpr uint32_t nominal_bit_period_ns = 4340;
    static constexpr uint32_t min_pulse_ns = 4600;
    // Realized bit period must stay within 5% of nominal
    static constexpr uint32_t tolerance_permille = 50;
    // Glitch filter must accept pulses 1.5x shorter than the shortest real one
    static constexpr uint32_t safety_margin_num = 3;
    static constexpr uint32_t safety_margin_den = 2;
    // Fewer than two samples rejects nothing
    static constexpr uint32_t min_glitch_filter_length = 2;

    static constexpr uint64_t ns_per_second = 1000000000ULL;

    // Cycle cost of the loops in sendToken()/lookForBit() on a given CPU.
    struct LoopCosts {
        // Read-modify-write, shift and loop bookkeeping per transmitted bit
        uint32_t bit_overhead_cycles;
        // One pass of RegisterPort::hold()
        uint32_t delay_iteration_cycles;
        // One pass of the lookForBit() search loop
        uint32_t sample_iteration_cycles;
    };

    struct TimingConstants {
        uint32_t cpu_hz;
        LoopCosts costs;
        // Target cycles per transmitted bit
        uint32_t bit_period_cycles;
        // hold() iterations per transmitted bit, overhead already subtracted
        uint32_t delay_iterations;
        // Consecutive matching samples needed before a level is trusted
        uint32_t glitch_filter_length;
    };

    constexpr uint32_t cyclesFromNanos(uint32_t cpu_hz, uint32_t ns) {
        return static_cast<uint32_t>(
            (static_cast<uint64_t>(cpu_hz) * ns + ns_per_second / 2) / ns_per_second);
    }

    constexpr uint32_t nanosFromCycles(uint32_t cpu_hz, uint32_t cycles) {
        return cpu_hz == 0 ? 0 : static_cast<uint32_t>(
            (static_cast<uint64_t>(cycles) * ns_per_second + cpu_hz / 2) / cpu_hz);
    }

    // Recompute whenever the clock or the loop code changes; never copy the
    // output of one clock configuration into another.
    constexpr TimingConstants deriveTiming(uint32_t cpu_hz, const LoopCosts& costs) {
        TimingConstants t{cpu_hz, costs, 0, 0, 0};
        t.bit_period_cycles = cyclesFromNanos(cpu_hz, nominal_bit_period_ns);

        if (costs.delay_iteration_cycles != 0 && t.bit_period_cycles > costs.bit_overhead_cycles) {
            const uint32_t budget = t.bit_period_cycles - costs.bit_overhead_cycles;
            t.delay_iterations =
                (budget + costs.delay_iteration_cycles / 2) / costs.delay_iteration_cycles;
        }

        if (costs.sample_iteration_cycles != 0) {
            // floor((min_pulse / sample_period) / margin)
            const uint64_t num = static_cast<uint64_t>(cpu_hz) * min_pulse_ns * safety_margin_den;
            const uint64_t den = ns_per_second * costs.sample_iteration_cycles * safety_margin_num;
            t.glitch_filter_length = static_cast<uint32_t>(num / den);
        }
        return t;
    }

    constexpr uint32_t realizedBitCycles(const TimingConstants& t) {
        return t.costs.bit_overhead_cycles + t.costs.delay_iteration_cycles * t.delay_iterations;
    }

    // Signed deviation of the realized bit period from nominal, in 1/1000
    constexpr int32_t bitPeriodErrorPermille(const TimingConstants& t) {
        const int64_t nominal = static_cast<int64_t>(t.cpu_hz) * nominal_bit_period_ns;
        const int64_t realized = static_cast<int64_t>(realizedBitCycles(t)) *
                                 static_cast<int64_t>(ns_per_second);
        return nominal == 0 ? 0 : static_cast<int32_t>(((realized - nominal) * 1000) / nominal);
    }

    constexpr bool isWithinTolerance(const TimingConstants& t) {
        const int64_t nominal = static_cast<int64_t>(t.cpu_hz) * nominal_bit_period_ns;
        const int64_t realized = static_cast<int64_t>(realizedBitCycles(t)) *
                                 static_cast<int64_t>(ns_per_second);
        const int64_t diff = realized > nominal ? realized - nominal : nominal - realized;
        return nominal != 0 && diff * 1000 <= nominal * static_cast<int64_t>(tolerance_permille);
    }

    // filter_length * sample_period * margin <= min_pulse
    constexpr bool isGlitchFilterSafe(const TimingConstants& t) {
        const uint64_t lhs = static_cast<uint64_t>(t.glitch_filter_length) *
                             t.costs.sample_iteration_cycles * safety_margin_num * ns_per_second;
        const uint64_t rhs = static_cast<uint64_t>(t.cpu_hz) * min_pulse_ns * safety_margin_den;
        return lhs <= rhs;
    }

    constexpr bool isValid(const TimingConstants& t) {
        return t.cpu_hz != 0 &&
               t.delay_iterations >= 1 &&
               t.glitch_filter_length >= min_glitch_filter_length &&
               isWithinTolerance(t) &&
               isGlitchFilterSafe(t);
    }

    // Sampler iteration budget covering timeout_us; never less than one
    constexpr uint32_t iterationsForMicros(const TimingConstants& t, uint32_t timeout_us) {
        if (t.costs.sample_iteration_cycles == 0) {
            return 1;
        }
        const uint64_t cycles = static_cast<uint64_t>(t.cpu_hz) * timeout_us / 1000000ULL;
        const uint64_t iterations = cycles / t.costs.sample_iteration_cycles;
        if (iterations == 0) {
            return 1;
        }
        return iterations > UINT32_MAX ? UINT32_MAX : static_cast<uint32_t>(iterations);
    }

    // sendToken() needs 1..32 bits; the core itself does not check
    static constexpr uint32_t max_token_bits = 32;

    constexpr bool isValidTokenSize(uint32_t bit_count) {
        return bit_count >= 1 && bit_count <= max_token_bits;
    }

    // lookForBit() needs at least one sample; the core itself does not check
    constexpr bool isValidTimeoutBudget(uint32_t timeout_iterations) {
        return timeout_iterations != 0;
    }

    // Cycle counts from timing the loops on the running chip: the same token
    // sent with two delay counts, and one sampler run of sample_budget passes.
    struct CalibrationRun {
        uint32_t short_cycles;
        uint32_t long_cycles;
        uint32_t sample_cycles;
        uint32_t bits;
        uint32_t short_delay;
        uint32_t long_delay;
        uint32_t sample_budget;
    };

    constexpr uint32_t roundedDiv(uint32_t num, uint32_t den) {
        return static_cast<uint32_t>((static_cast<uint64_t>(num) + den / 2) / den);
    }

    // Two-point fit of cycles_per_bit = overhead + per_iteration * delay.
    // False (out_costs untouched) if the run cannot yield usable costs.
    constexpr bool fitLoopCosts(const CalibrationRun& run, LoopCosts& out_costs) {
        if (run.bits == 0 || run.sample_budget == 0 || run.long_delay <= run.short_delay ||
            run.long_cycles <= run.short_cycles) {
            return false;
        }
        const uint64_t iteration_span = static_cast<uint64_t>(run.bits) * (run.long_delay - run.short_delay);
        if (iteration_span > UINT32_MAX) {
            return false;
        }
        const uint32_t per_iteration =
            roundedDiv(run.long_cycles - run.short_cycles, static_cast<uint32_t>(iteration_span));
        const uint32_t short_per_bit = roundedDiv(run.short_cycles, run.bits);
        const uint32_t delay_part = per_iteration * run.short_delay;
        const uint32_t per_sample = roundedDiv(run.sample_cycles, run.sample_budget);
        if (per_iteration == 0 || per_sample == 0) {
            return false;
        }

        out_costs.delay_iteration_cycles = per_iteration;
        out_costs.bit_overhead_cycles = short_per_bit > delay_part ? short_per_bit - delay_part : 0;
        out_costs.sample_iteration_cycles = per_sample;
        return true;
    }
}

#endif // SWI_TIMING_HPP
