#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <main/hardware/swi_bus.hpp>
#include <main/utils/timing_calibration.hpp>

namespace {
    static const char* TAG = "MAIN";

    static SwiBus s_bus;

    static void calibrate() {
        Swi::LoopCosts measured = {};
        if (!TimingCalibration::measure(s_bus, measured)) {
            LOG_WARN(TAG, "%s", "Loop calibration failed; keeping build-time timing");
            return;
        }
        if (TimingCalibration::verify(s_bus.timing(), measured)) {
            return;
        }
        if (!Config::Swi::use_measured_timing) {
            LOG_WARN(TAG, "%s", "Build-time loop_costs do not match this chip; update Config::Swi::loop_costs");
            return;
        }
        const Swi::TimingConstants derived = Swi::deriveTiming(Config::Cpu::frequency_hz, measured);
        if (!s_bus.applyTiming(derived)) {
            LOG_ERROR(TAG, "%s", "No valid timing for measured loop costs");
        }
    }
}

extern "C" void app_main(void)
{
    Logger::setLevel(Config::Logging::level);
    Logger::setEspLogLevel("gpio", Config::Logging::gpio_driver_level);
    LOG_INFO("MAIN", "%s", "---SWI secure element link started---");

    if (!s_bus.init()) {
        LOG_ERROR(TAG, "%s", "SWI bus init failed");
        return;
    }

    if (Config::Swi::calibrate_on_boot) {
        calibrate();
    }

    // Released line is pulled up; anything else means a stuck bus
    s_bus.release();
    if (s_bus.lookForBitMicros(1, Config::Swi::idle_check_us)) {
        LOG_INFO(TAG, "%s", "SWI line idle high");
    } else {
        LOG_ERROR(TAG, "SWI line not high within %lu us; check pull-up and wiring",
                  static_cast<unsigned long>(Config::Swi::idle_check_us));
    }

    // Protocol layer sequences sendToken()/lookForBit() from here on
    for (;;) {
        vTaskDelay(portMAX_DELAY);
    }
}
