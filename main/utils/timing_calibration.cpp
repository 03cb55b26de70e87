#include <main/utils/timing_calibration.hpp>
#include <main/swi/bit_transmitter.hpp>
#include <main/swi/glitch_filtered_sampler.hpp>
#include <main/utils/logger.hpp>
#include <esp_attr.h>
#include <esp_cpu.h>
#include <freertos/FreeRTOS.h>

namespace {
    static const char* TAG = "SWI_CAL";

    // All-ones token: writing 1 to the released open-drain line changes nothing
    static constexpr uint32_t calibration_token = 0xFFFFFFFFu;
    static constexpr uint32_t calibration_bits = 32;
    static constexpr uint32_t short_delay = 1;
    static constexpr uint32_t long_delay = 101;
    static constexpr uint32_t sample_budget = 4096;

    static portMUX_TYPE s_mux = portMUX_INITIALIZER_UNLOCKED;

    static IRAM_ATTR uint32_t timeSendToken(Swi::RegisterPort port, uint32_t delay_iterations) {
        Swi::TimingConstants timing = {};
        timing.delay_iterations = delay_iterations;

        portENTER_CRITICAL(&s_mux);
        const esp_cpu_cycle_count_t start = esp_cpu_get_cycle_count();
        Swi::sendToken(port, calibration_token, calibration_bits, timing);
        const esp_cpu_cycle_count_t end = esp_cpu_get_cycle_count();
        portEXIT_CRITICAL(&s_mux);
        return static_cast<uint32_t>(end - start);
    }

    static IRAM_ATTR uint32_t timeSampler(Swi::RegisterPort port) {
        // Unreachable filter length: the search always runs the full budget
        Swi::TimingConstants timing = {};
        timing.glitch_filter_length = UINT32_MAX;

        portENTER_CRITICAL(&s_mux);
        const esp_cpu_cycle_count_t start = esp_cpu_get_cycle_count();
        const bool found = Swi::lookForBit(port, 1, sample_budget, timing);
        const esp_cpu_cycle_count_t end = esp_cpu_get_cycle_count();
        portEXIT_CRITICAL(&s_mux);
        (void)found;
        return static_cast<uint32_t>(end - start);
    }
}

namespace TimingCalibration {
    bool measure(SwiBus& bus, Swi::LoopCosts& out_costs) {
        if (!bus.isInitialized()) {
            LOG_ERROR(TAG, "%s", "Bus not initialized");
            return false;
        }
        bus.release();

        const uint32_t short_cycles = timeSendToken(bus.latchPort(), short_delay);
        const uint32_t long_cycles = timeSendToken(bus.latchPort(), long_delay);
        const uint32_t sample_cycles = timeSampler(bus.linePort());

        const Swi::CalibrationRun run = {
            short_cycles, long_cycles, sample_cycles,
            calibration_bits, short_delay, long_delay, sample_budget,
        };
        if (!Swi::fitLoopCosts(run, out_costs)) {
            LOG_ERROR(TAG, "Inconsistent loop timing: delay %lu -> %lu cycles, sampler %lu cycles",
                      static_cast<unsigned long>(short_cycles), static_cast<unsigned long>(long_cycles),
                      static_cast<unsigned long>(sample_cycles));
            return false;
        }

        LOG_INFO(TAG, "Measured: overhead %lu, delay %lu/iter, sample %lu/iter (cycles)",
                 static_cast<unsigned long>(out_costs.bit_overhead_cycles),
                 static_cast<unsigned long>(out_costs.delay_iteration_cycles),
                 static_cast<unsigned long>(out_costs.sample_iteration_cycles));
        return true;
    }

    bool verify(const Swi::TimingConstants& configured, const Swi::LoopCosts& measured) {
        Swi::TimingConstants actual = configured;
        actual.costs = measured;

        const bool period_ok = Swi::isWithinTolerance(actual);
        const bool filter_ok = Swi::isGlitchFilterSafe(actual);

        if (period_ok) {
            LOG_INFO(TAG, "Bit period %lu ns (%ld permille)",
                     static_cast<unsigned long>(Swi::nanosFromCycles(actual.cpu_hz, Swi::realizedBitCycles(actual))),
                     static_cast<long>(Swi::bitPeriodErrorPermille(actual)));
        } else {
            LOG_WARN(TAG, "Bit period %lu ns is %ld permille off nominal %lu ns",
                     static_cast<unsigned long>(Swi::nanosFromCycles(actual.cpu_hz, Swi::realizedBitCycles(actual))),
                     static_cast<long>(Swi::bitPeriodErrorPermille(actual)),
                     static_cast<unsigned long>(Swi::nominal_bit_period_ns));
        }
        if (!filter_ok) {
            LOG_WARN(TAG, "Glitch filter of %lu samples exceeds %lu ns minimum pulse with margin",
                     static_cast<unsigned long>(actual.glitch_filter_length),
                     static_cast<unsigned long>(Swi::min_pulse_ns));
        }
        return period_ok && filter_ok;
    }
}
