#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <sdkconfig.h>
#include <driver/gpio.h>
#include <main/swi/swi_timing.hpp>
#include <main/utils/logger.hpp>

namespace Config {
namespace Cpu {
    // Must match the clock the chip actually runs at; SwiBus::init() checks it
    static constexpr uint32_t frequency_hz = CONFIG_ESP_DEFAULT_CPU_FREQ_MHZ * 1000000u;
}

namespace Hardware {
namespace Pins {
    // The bit-bang core drives bit 0 of GPIO_OUT_REG / samples bit 0 of GPIO_IN_REG
    static constexpr gpio_num_t swi_gpio = GPIO_NUM_0;
} // namespace Pins
}

namespace Swi {
    // Cycle cost of the loops in main/swi on this CPU family.
    // Nominal values; confirm with TimingCalibration::measure() on new
    // silicon or after touching the loop code.
#if CONFIG_IDF_TARGET_ARCH_XTENSA
    static constexpr ::Swi::LoopCosts loop_costs = {
        28,  // bit_overhead_cycles: GPIO_OUT_REG read + write over APB, shift, branch
        3,   // delay_iteration_cycles: addi + taken bnez
        22,  // sample_iteration_cycles: GPIO_IN_REG read, mask/xor, update, two branches
    };
#else
    static constexpr ::Swi::LoopCosts loop_costs = {
        16,  // bit_overhead_cycles
        3,   // delay_iteration_cycles
        12,  // sample_iteration_cycles
    };
#endif

    // Derived from the clock above at build time
    static constexpr ::Swi::TimingConstants timing =
        ::Swi::deriveTiming(Cpu::frequency_hz, loop_costs);
    static_assert(::Swi::isValid(timing),
                  "SWI timing out of tolerance for this CPU clock; re-measure loop_costs");

    // Idle line (pulled up) must be seen within this window during bring-up
    static constexpr uint32_t idle_check_us = 100;

    // Measure loop costs at boot and report drift against loop_costs
    static constexpr bool calibrate_on_boot = true;
    // Replace the build-time table with one derived from the measurement
    static constexpr bool use_measured_timing = false;
}

namespace Logging {
    static constexpr LogLevel level = LogLevel::INFO;
    // gpio_config() logs every pin at INFO
    static constexpr esp_log_level_t gpio_driver_level = ESP_LOG_WARN;
}
}

#endif // CONFIG_HPP
