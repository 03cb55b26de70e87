// Measures the real cycle cost of the SWI bit-bang loops with the CPU cycle
// counter, so Config::Swi::loop_costs can be checked on the running chip.
#ifndef TIMING_CALIBRATION_HPP
#define TIMING_CALIBRATION_HPP

#include <main/hardware/swi_bus.hpp>
#include <main/swi/swi_timing.hpp>

namespace TimingCalibration {
    // Run the loops against the real GPIO registers with the line released.
    // Drives only ones (no-ops on the open-drain line). Bus must be initialized.
    bool measure(SwiBus& bus, Swi::LoopCosts& out_costs);

    // True if the configured table still meets the 5% window and the glitch
    // filter margin when run with the measured costs. Logs the comparison.
    bool verify(const Swi::TimingConstants& configured, const Swi::LoopCosts& measured);
}

#endif // TIMING_CALIBRATION_HPP
