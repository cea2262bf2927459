/// @file test_result.cpp
/// @brief Status byte and result word decoding tests

#include "TestHarness.h"

#include "LTC2983/Result.h"

using namespace LTC2983;

TEST(status_power_up_idle) {
  ConversionStatus s = decodeStatus(0x40);
  ASSERT_TRUE(s.done);
  ASSERT_FALSE(s.started);
  ASSERT_EQ(s.channel, 0);
  ASSERT_TRUE(s.isMultiChannel());
}

TEST(status_converting) {
  ConversionStatus s = decodeStatus(0x85);
  ASSERT_TRUE(s.started);
  ASSERT_FALSE(s.done);
  ASSERT_EQ(s.channel, 5);
  ASSERT_FALSE(s.isMultiChannel());
}

TEST(status_done_ignores_unused_bit) {
  ConversionStatus s = decodeStatus(0x74);  // bit 5 unused
  ASSERT_TRUE(s.done);
  ASSERT_EQ(s.channel, 20);
}

TEST(result_positive_valid) {
  ConversionResult r = decodeResult(1, 0x01009200u);
  ASSERT_EQ(r.channel, 1);
  ASSERT_TRUE(r.valid);
  ASSERT_FALSE(r.hasAnyFault());
  ASSERT_EQ(r.raw, 37376);
  ASSERT_NEAR(r.temperature(), 36.5, 1e-6);
}

TEST(result_negative_sign_extended) {
  ConversionResult r = decodeResult(2, 0x01FFFC00u);
  ASSERT_EQ(r.raw, -1024);
  ASSERT_NEAR(r.temperature(), -1.0, 1e-6);

  r = decodeResult(2, 0x01800000u);
  ASSERT_EQ(r.raw, -8388608);
  ASSERT_NEAR(r.temperature(), -8192.0, 1e-3);

  r = decodeResult(2, 0x017FFFFFu);
  ASSERT_EQ(r.raw, 8388607);
}

TEST(result_fractional_lsb) {
  ConversionResult r = decodeResult(3, 0x01000001u);
  ASSERT_EQ(r.raw, 1);
  ASSERT_NEAR(r.temperature(), 1.0 / 1024.0, 1e-9);
}

TEST(result_open_circuit_keeps_value) {
  ConversionResult r = decodeResult(4, 0x80000000u);
  ASSERT_TRUE(r.hasFault(Fault::OPEN_CIRCUIT));
  ASSERT_TRUE(r.hasFault(Fault::SENSOR_HARD_FAULT));
  ASSERT_FALSE(r.hasFault(Fault::CJ_HARD_FAULT));
  ASSERT_EQ(r.faults, static_cast<uint8_t>(Fault::OPEN_CIRCUIT));
  ASSERT_FALSE(r.valid);
  ASSERT_NEAR(r.temperature(), 0.0, 1e-9);
}

TEST(result_each_fault_bit) {
  const Fault faults[] = {
    Fault::SENSOR_HARD_FAULT, Fault::HARD_ADC_OUT_OF_RANGE, Fault::CJ_HARD_FAULT,
    Fault::CJ_SOFT_FAULT, Fault::SENSOR_OVER_RANGE, Fault::SENSOR_UNDER_RANGE,
    Fault::ADC_OUT_OF_RANGE
  };
  for (Fault f : faults) {
    uint32_t word = (static_cast<uint32_t>(f) << 24) | 0x00006400u;
    ConversionResult r = decodeResult(6, word);
    ASSERT_EQ(r.faults, static_cast<uint8_t>(f));
    ASSERT_TRUE(r.hasFault(f));
    ASSERT_EQ(r.raw, 0x6400);
    ASSERT_NEAR(r.temperature(), 25.0, 1e-6);
  }
}

TEST(result_valid_bit_is_not_fault) {
  ConversionResult r = decodeResult(7, 0xFF000000u);
  ASSERT_TRUE(r.valid);
  ASSERT_EQ(r.faults, 0xFE);

  r = decodeResult(7, 0x00000000u);
  ASSERT_FALSE(r.valid);
  ASSERT_FALSE(r.hasAnyFault());
}

int main() {
  printf("\n=== LTC2983 Result Decoding Tests ===\n\n");

  RUN_TEST(status_power_up_idle);
  RUN_TEST(status_converting);
  RUN_TEST(status_done_ignores_unused_bit);
  RUN_TEST(result_positive_valid);
  RUN_TEST(result_negative_sign_extended);
  RUN_TEST(result_fractional_lsb);
  RUN_TEST(result_open_circuit_keeps_value);
  RUN_TEST(result_each_fault_bit);
  RUN_TEST(result_valid_bit_is_not_fault);

  TEST_SUMMARY();

  return testsFailed > 0 ? 1 : 0;
}
