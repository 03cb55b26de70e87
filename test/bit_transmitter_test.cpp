#include <gtest/gtest.h>
#include <support/fake_ports.hpp>
#include <main/swi/bit_transmitter.hpp>
#include <main/swi/swi_timing.hpp>

namespace {
    const Swi::TimingConstants timing = Swi::deriveTiming(72000000u, {9, 3, 12});

    std::vector<uint32_t> expectedLevels(uint32_t token, uint32_t bit_count) {
        std::vector<uint32_t> out;
        for (uint32_t i = 0; i < bit_count; ++i) {
            out.push_back((token >> i) & 1u);
        }
        return out;
    }
}

TEST(BitTransmitter, SendsLeastSignificantBitFirst) {
    RecordingPort port;
    Swi::sendToken(port, 0xDu, 4, timing);
    EXPECT_EQ(port.levels(), (std::vector<uint32_t>{1, 0, 1, 1}));
}

TEST(BitTransmitter, HoldsEveryBitForCalibratedIterations) {
    RecordingPort port;
    Swi::sendToken(port, 0x5Au, 8, timing);

    ASSERT_EQ(port.events.size(), 16u);
    for (std::size_t i = 0; i < port.events.size(); i += 2) {
        EXPECT_EQ(port.events[i].kind, RecordingPort::Event::WRITE);
        EXPECT_EQ(port.events[i + 1].kind, RecordingPort::Event::HOLD);
        EXPECT_EQ(port.events[i + 1].value, timing.delay_iterations);
    }
}

TEST(BitTransmitter, IgnoresBitsAboveCount) {
    RecordingPort port;
    Swi::sendToken(port, 0xFFFFFFF0u, 4, timing);
    EXPECT_EQ(port.levels(), (std::vector<uint32_t>{0, 0, 0, 0}));
}

TEST(BitTransmitter, SingleBitToken) {
    RecordingPort low(0x80000001u);
    Swi::sendToken(low, 0x2u, 1, timing);
    EXPECT_EQ(low.registerWrites(), (std::vector<uint32_t>{0x80000000u}));
    EXPECT_EQ(low.holds().size(), 1u);

    RecordingPort high(0x80000000u);
    Swi::sendToken(high, 0x1u, 1, timing);
    EXPECT_EQ(high.registerWrites(), (std::vector<uint32_t>{0x80000001u}));
}

TEST(BitTransmitter, FullWidthToken) {
    RecordingPort port;
    Swi::sendToken(port, 0x80000001u, 32, timing);

    const std::vector<uint32_t> levels = port.levels();
    ASSERT_EQ(levels.size(), 32u);
    EXPECT_EQ(levels.front(), 1u);
    EXPECT_EQ(levels.back(), 1u);
    for (std::size_t i = 1; i < 31; ++i) {
        EXPECT_EQ(levels[i], 0u) << "bit " << i;
    }
}

TEST(BitTransmitter, EveryCountSendsExactlyThatManyBits) {
    const uint32_t tokens[] = {0x00000000u, 0xFFFFFFFFu, 0xA5A5A5A5u, 0x12345678u};
    for (uint32_t token : tokens) {
        for (uint32_t bit_count = 1; bit_count <= 32; ++bit_count) {
            RecordingPort port;
            Swi::sendToken(port, token, bit_count, timing);
            EXPECT_EQ(port.levels(), expectedLevels(token, bit_count))
                << "token " << std::hex << token << std::dec << " bits " << bit_count;
            EXPECT_EQ(port.holds().size(), bit_count);
        }
    }
}

TEST(BitTransmitter, OtherRegisterBitsSurviveEveryWrite) {
    const uint32_t other_bits = 0xDEADBEE0u;
    RecordingPort port(other_bits);
    Swi::sendToken(port, 0x2Du, 6, timing);

    for (uint32_t value : port.registerWrites()) {
        EXPECT_EQ(value & ~Swi::line_mask, other_bits);
    }
}

TEST(BitTransmitter, DrivesRealRegister) {
    volatile uint32_t reg = 0x0F0F0F00u;
    Swi::RegisterPort port(&reg);

    Swi::sendToken(port, 0x3u, 2, timing);
    EXPECT_EQ(reg, 0x0F0F0F01u);

    Swi::sendToken(port, 0x1u, 2, timing);
    EXPECT_EQ(reg, 0x0F0F0F00u);
}
