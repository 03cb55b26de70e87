#ifndef SWI_BUS_HPP
#define SWI_BUS_HPP

#include <cstdint>
#include <driver/gpio.h>
#include <freertos/FreeRTOS.h>
#include <main/config/config.hpp>
#include <main/swi/register_port.hpp>
#include <main/swi/swi_timing.hpp>

// Single-wire link to the secure element on GPIO0.
// Owns the environment the bit-bang core expects: open-drain pin
// configuration, interrupts masked per call, code in IRAM.
// Does not retry; a false from lookForBit() is for the caller to interpret.
//
// Transmitting read-modify-writes the whole GPIO_OUT_REG (GPIO0-31). The
// critical section only masks interrupts on the calling core, so nothing on
// the other core may drive GPIO0-31 outputs (gpio_set_level, W1TS/W1TC)
// while a transaction is in progress, or its write can be undone.
class SwiBus {
public:
    explicit SwiBus(const Swi::TimingConstants& timing = Config::Swi::timing);

    // Validate timing, configure the pin, release the line. False on failure.
    bool init();

    // Replace the timing table (e.g. with a calibrated one). Rejected if invalid.
    bool applyTiming(const Swi::TimingConstants& timing);

    // bit_count 1..32, LSB first. Out-of-range counts are logged and dropped.
    void sendToken(uint32_t token, uint32_t bit_count);

    // True once desired_level has been sustained for the glitch filter length
    bool lookForBit(uint32_t desired_level, uint32_t timeout_iterations);
    bool lookForBitMicros(uint32_t desired_level, uint32_t timeout_us);

    // Stop driving low so the device can pull the line
    void release();

    const Swi::TimingConstants& timing() const;
    bool isInitialized() const;

    // Raw ports for calibration; bit 0 of each is the SWI pin
    Swi::RegisterPort latchPort() const;
    Swi::RegisterPort linePort() const;

private:
    bool checkCpuClock() const;
    void logTiming() const;

    Swi::TimingConstants timing_;
    gpio_num_t pin;
    portMUX_TYPE mux;
    bool initialized;
};

#endif // SWI_BUS_HPP
