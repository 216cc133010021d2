#include <unity.h>

#include <cmath>

#include "compute/spo2_calc.h"

using signal_cond::ConditionedSample;
using spo2_calc::CalibrationPoint;
using spo2_calc::CalibrationTable;
using spo2_calc::Spo2Estimator;
using spo2_calc::WindowResult;

void setUp() {}
void tearDown() {}

// One beat window of a square-ish pulse with the given peak-to-peak and DC.
static void feed_window(Spo2Estimator& est, float ir_pp, float ir_dc, float red_pp, float red_dc) {
  for (int i = 0; i < 80; ++i) {
    const float sign = (i % 2 == 0) ? 0.5f : -0.5f;
    ConditionedSample s;
    s.ir_ac = sign * ir_pp;
    s.red_ac = sign * red_pp;
    s.ir_dc = ir_dc;
    s.red_dc = red_dc;
    est.add(s);
  }
}

void test_standard_table_knots() {
  const CalibrationTable& t = CalibrationTable::standard();
  TEST_ASSERT_TRUE(t.valid());
  TEST_ASSERT_EQUAL_UINT32(6, t.size());
  TEST_ASSERT_EQUAL_FLOAT(100.0f, t.lookup(0.4f));
  TEST_ASSERT_EQUAL_FLOAT(90.0f, t.lookup(0.8f));
  TEST_ASSERT_EQUAL_FLOAT(70.0f, t.lookup(1.6f));
}

void test_lookup_interpolates_and_clamps() {
  const CalibrationTable& t = CalibrationTable::standard();
  TEST_ASSERT_FLOAT_WITHIN(0.01f, 97.5f, t.lookup(0.5f));
  TEST_ASSERT_FLOAT_WITHIN(0.01f, 75.0f, t.lookup(1.4f));
  TEST_ASSERT_EQUAL_FLOAT(100.0f, t.lookup(0.1f));
  TEST_ASSERT_EQUAL_FLOAT(70.0f, t.lookup(3.0f));
  TEST_ASSERT_TRUE(std::isnan(t.lookup(NAN)));
}

void test_custom_table() {
  const CalibrationPoint points[] = {{0.5f, 99.0f}, {1.0f, 89.0f}};
  const CalibrationTable t(points);
  TEST_ASSERT_TRUE(t.valid());
  TEST_ASSERT_FLOAT_WITHIN(0.01f, 94.0f, t.lookup(0.75f));
  TEST_ASSERT_EQUAL_FLOAT(0.5f, t.min_ratio());
  TEST_ASSERT_EQUAL_FLOAT(1.0f, t.max_ratio());
}

void test_unordered_table_is_empty() {
  const CalibrationPoint points[] = {{0.5f, 99.0f}, {0.5f, 95.0f}, {1.0f, 89.0f}};
  const CalibrationTable t(points);
  TEST_ASSERT_FALSE(t.valid());
  TEST_ASSERT_EQUAL_UINT32(0, t.size());
  TEST_ASSERT_TRUE(std::isnan(t.lookup(0.7f)));
}

void test_ratio_of_ratios_window() {
  Spo2Estimator est;
  est.configure(4);
  TEST_ASSERT_FALSE(est.valid());

  // First beat only opens a window
  TEST_ASSERT_EQUAL(WindowResult::kNoWindow, est.close_window());
  TEST_ASSERT_TRUE(est.window_open());

  // (800 / 25000) / (2000 / 50000) = 0.8
  feed_window(est, 2000.0f, 50000.0f, 800.0f, 25000.0f);
  TEST_ASSERT_EQUAL_UINT32(80, est.window_samples());
  TEST_ASSERT_EQUAL(WindowResult::kAccepted, est.close_window());
  TEST_ASSERT_TRUE(est.valid());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 0.8f, est.last_ratio());
  TEST_ASSERT_FLOAT_WITHIN(0.01f, 90.0f, est.spo2());
}

void test_smoothing_over_last_windows() {
  Spo2Estimator est;
  est.configure(2);
  est.close_window();

  feed_window(est, 2000.0f, 50000.0f, 800.0f, 25000.0f);   // R 0.8 -> 90
  est.close_window();
  feed_window(est, 2000.0f, 50000.0f, 400.0f, 25000.0f);   // R 0.4 -> 100
  est.close_window();
  TEST_ASSERT_FLOAT_WITHIN(0.01f, 95.0f, est.spo2());

  feed_window(est, 2000.0f, 50000.0f, 1200.0f, 25000.0f);  // R 1.2 -> 80
  est.close_window();
  TEST_ASSERT_FLOAT_WITHIN(0.01f, 90.0f, est.spo2());
}

void test_bad_windows_are_skipped() {
  Spo2Estimator est;
  est.configure(4);
  est.close_window();

  feed_window(est, 0.0f, 50000.0f, 800.0f, 25000.0f);
  TEST_ASSERT_EQUAL(WindowResult::kNoPulse, est.close_window());

  feed_window(est, 2000.0f, 50.0f, 800.0f, 25000.0f);
  TEST_ASSERT_EQUAL(WindowResult::kLowDc, est.close_window());

  TEST_ASSERT_FALSE(est.valid());
  TEST_ASSERT_TRUE(std::isnan(est.spo2()));
}

void test_empty_table_rejects_windows() {
  const CalibrationPoint points[] = {{1.0f, 90.0f}, {0.5f, 99.0f}};
  Spo2Estimator est{CalibrationTable(points)};
  est.configure(4);
  est.close_window();
  feed_window(est, 2000.0f, 50000.0f, 800.0f, 25000.0f);
  TEST_ASSERT_EQUAL(WindowResult::kOutOfTable, est.close_window());
  TEST_ASSERT_FALSE(est.valid());
}

void test_restart_window_discards_samples() {
  Spo2Estimator est;
  est.configure(4);
  est.close_window();
  feed_window(est, 2000.0f, 50000.0f, 800.0f, 25000.0f);
  est.restart_window();
  TEST_ASSERT_EQUAL_UINT32(0, est.window_samples());
  TEST_ASSERT_EQUAL(WindowResult::kNoWindow, est.close_window());

  est.reset();
  TEST_ASSERT_FALSE(est.window_open());
  TEST_ASSERT_TRUE(std::isnan(est.last_ratio()));
}

static int run_all() {
  UNITY_BEGIN();
  RUN_TEST(test_standard_table_knots);
  RUN_TEST(test_lookup_interpolates_and_clamps);
  RUN_TEST(test_custom_table);
  RUN_TEST(test_unordered_table_is_empty);
  RUN_TEST(test_ratio_of_ratios_window);
  RUN_TEST(test_smoothing_over_last_windows);
  RUN_TEST(test_bad_windows_are_skipped);
  RUN_TEST(test_empty_table_rejects_windows);
  RUN_TEST(test_restart_window_discards_samples);
  return UNITY_END();
}

#ifdef ARDUINO
#include <Arduino.h>
void setup() { run_all(); }
void loop() {}
#else
int main() { return run_all(); }
#endif
