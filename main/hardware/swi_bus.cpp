#include <main/hardware/swi_bus.hpp>
#include <main/swi/bit_transmitter.hpp>
#include <main/swi/glitch_filtered_sampler.hpp>
#include <main/utils/logger.hpp>
#include <driver/gpio.h>
#include <esp_attr.h>
#include <esp_rom_sys.h>
#include <soc/gpio_reg.h>

static const char* TAG_SWI = "SWI";

static_assert(Config::Hardware::Pins::swi_gpio == GPIO_NUM_0,
              "bit-bang core drives bit 0 of the GPIO registers only");

SwiBus::SwiBus(const Swi::TimingConstants& timing)
    : timing_(timing),
      pin(Config::Hardware::Pins::swi_gpio),
      initialized(false) {
    portMUX_INITIALIZE(&mux);
}

bool SwiBus::init() {
    if (!Swi::isValid(timing_)) {
        LOG_ERROR(TAG_SWI, "Timing table invalid (delay=%lu filter=%lu error=%ld permille)",
                  static_cast<unsigned long>(timing_.delay_iterations),
                  static_cast<unsigned long>(timing_.glitch_filter_length),
                  static_cast<long>(Swi::bitPeriodErrorPermille(timing_)));
        return false;
    }
    if (!checkCpuClock()) {
        return false;
    }

    // Open drain with pull-up: the line idles high, both sides pull low.
    // Input stays enabled so the same pin can be sampled without switching.
    gpio_config_t io_conf = {};
    io_conf.intr_type = GPIO_INTR_DISABLE;
    io_conf.mode = GPIO_MODE_INPUT_OUTPUT_OD;
    io_conf.pin_bit_mask = (1ULL << pin);
    io_conf.pull_down_en = GPIO_PULLDOWN_DISABLE;
    io_conf.pull_up_en = GPIO_PULLUP_ENABLE;
    esp_err_t err = gpio_config(&io_conf);
    if (err != ESP_OK) {
        LOG_ERROR(TAG_SWI, "gpio_config failed on GPIO %d: %d", static_cast<int>(pin), static_cast<int>(err));
        return false;
    }

    initialized = true;
    release();
    logTiming();
    return true;
}

bool SwiBus::applyTiming(const Swi::TimingConstants& timing) {
    if (!Swi::isValid(timing)) {
        LOG_WARN(TAG_SWI, "Rejected timing table (delay=%lu filter=%lu error=%ld permille)",
                 static_cast<unsigned long>(timing.delay_iterations),
                 static_cast<unsigned long>(timing.glitch_filter_length),
                 static_cast<long>(Swi::bitPeriodErrorPermille(timing)));
        return false;
    }
    timing_ = timing;
    logTiming();
    return true;
}

bool SwiBus::checkCpuClock() const {
    const uint32_t running_mhz = esp_rom_get_cpu_ticks_per_us();
    const uint32_t configured_mhz = timing_.cpu_hz / 1000000u;
    if (running_mhz != configured_mhz) {
        LOG_ERROR(TAG_SWI, "CPU runs at %lu MHz but timing was derived for %lu MHz",
                  static_cast<unsigned long>(running_mhz), static_cast<unsigned long>(configured_mhz));
        return false;
    }
    return true;
}

void SwiBus::logTiming() const {
    if (!Logger::isEnabled(LogLevel::INFO)) {
        return;
    }
    LOG_INFO(TAG_SWI, "GPIO %d @ %lu MHz: bit %lu cycles (%lu ns, %ld permille), delay x%lu",
             static_cast<int>(pin),
             static_cast<unsigned long>(timing_.cpu_hz / 1000000u),
             static_cast<unsigned long>(Swi::realizedBitCycles(timing_)),
             static_cast<unsigned long>(Swi::nanosFromCycles(timing_.cpu_hz, Swi::realizedBitCycles(timing_))),
             static_cast<long>(Swi::bitPeriodErrorPermille(timing_)),
             static_cast<unsigned long>(timing_.delay_iterations));
    LOG_INFO(TAG_SWI, "Glitch filter %lu samples (%lu ns)",
             static_cast<unsigned long>(timing_.glitch_filter_length),
             static_cast<unsigned long>(Swi::nanosFromCycles(
                 timing_.cpu_hz, timing_.glitch_filter_length * timing_.costs.sample_iteration_cycles)));
}

void IRAM_ATTR SwiBus::sendToken(uint32_t token, uint32_t bit_count) {
    if (!initialized) {
        LOG_ERROR(TAG_SWI, "%s", "sendToken before init");
        return;
    }
    if (!Swi::isValidTokenSize(bit_count)) {
        LOG_ERROR(TAG_SWI, "Invalid token size %lu", static_cast<unsigned long>(bit_count));
        return;
    }
    Swi::RegisterPort port = latchPort();
    portENTER_CRITICAL(&mux);
    Swi::sendToken(port, token, bit_count, timing_);
    portEXIT_CRITICAL(&mux);
}

bool IRAM_ATTR SwiBus::lookForBit(uint32_t desired_level, uint32_t timeout_iterations) {
    if (!initialized) {
        LOG_ERROR(TAG_SWI, "%s", "lookForBit before init");
        return false;
    }
    if (!Swi::isValidTimeoutBudget(timeout_iterations)) {
        LOG_ERROR(TAG_SWI, "%s", "lookForBit with empty timeout budget");
        return false;
    }
    Swi::RegisterPort port = linePort();
    portENTER_CRITICAL(&mux);
    const bool found = Swi::lookForBit(port, desired_level, timeout_iterations, timing_);
    portEXIT_CRITICAL(&mux);
    return found;
}

bool SwiBus::lookForBitMicros(uint32_t desired_level, uint32_t timeout_us) {
    return lookForBit(desired_level, Swi::iterationsForMicros(timing_, timeout_us));
}

void SwiBus::release() {
    if (!initialized) {
        return;
    }
    Swi::RegisterPort port = latchPort();
    portENTER_CRITICAL(&mux);
    port.writeLevel(1);
    portEXIT_CRITICAL(&mux);
}

const Swi::TimingConstants& SwiBus::timing() const {
    return timing_;
}

bool SwiBus::isInitialized() const {
    return initialized;
}

Swi::RegisterPort SwiBus::latchPort() const {
    return Swi::RegisterPort(reinterpret_cast<volatile uint32_t*>(GPIO_OUT_REG));
}

Swi::RegisterPort SwiBus::linePort() const {
    return Swi::RegisterPort(reinterpret_cast<volatile uint32_t*>(GPIO_IN_REG));
}
