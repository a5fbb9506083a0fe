/**
 * @file TelemetryProvider_uTest.cpp
 * @brief Unit tests for backend selection and status strings.
 */

#include "src/telemetry/inc/TelemetryProvider.hpp"

#include <gtest/gtest.h>

using gpuwatch::telemetry::Backend;
using gpuwatch::telemetry::makeProvider;
using gpuwatch::telemetry::nvmlBackendAvailable;
using gpuwatch::telemetry::parseBackend;
using gpuwatch::telemetry::PollResult;
using gpuwatch::telemetry::PollStatus;
using gpuwatch::telemetry::ProviderConfig;
using gpuwatch::telemetry::toString;

/** @test Backend names parse; unknown names do not. */
TEST(TelemetryProviderTest, ParseBackend) {
  EXPECT_EQ(parseBackend("auto"), Backend::AUTO);
  EXPECT_EQ(parseBackend("smi"), Backend::SMI);
  EXPECT_EQ(parseBackend("nvidia-smi"), Backend::SMI);
  EXPECT_EQ(parseBackend("nvml"), Backend::NVML);
  EXPECT_FALSE(parseBackend("NVML").has_value());
  EXPECT_FALSE(parseBackend("").has_value());
}

/** @test Status and backend strings. */
TEST(TelemetryProviderTest, ToString) {
  EXPECT_STREQ(toString(PollStatus::OK), "OK");
  EXPECT_STREQ(toString(PollStatus::PROVIDER_MISSING), "PROVIDER_MISSING");
  EXPECT_STREQ(toString(PollStatus::DRIVER_UNAVAILABLE), "DRIVER_UNAVAILABLE");
  EXPECT_STREQ(toString(PollStatus::TIMEOUT), "TIMEOUT");
  EXPECT_STREQ(toString(PollStatus::MALFORMED_RESPONSE), "MALFORMED_RESPONSE");
  EXPECT_STREQ(toString(PollStatus::NO_DEVICES), "NO_DEVICES");
  EXPECT_STREQ(toString(Backend::AUTO), "auto");
  EXPECT_STREQ(toString(Backend::SMI), "smi");
  EXPECT_STREQ(toString(Backend::NVML), "nvml");
}

/** @test failure() builds an empty, non-OK result. */
TEST(TelemetryProviderTest, FailureResult) {
  const PollResult R = PollResult::failure(PollStatus::TIMEOUT, "slow");
  EXPECT_FALSE(R.ok());
  EXPECT_EQ(R.status, PollStatus::TIMEOUT);
  EXPECT_EQ(R.detail, "slow");
  EXPECT_TRUE(R.gpus.empty());
}

/** @test The build flag and the runtime query agree. */
TEST(TelemetryProviderTest, NvmlAvailabilityMatchesBuild) {
  EXPECT_EQ(nvmlBackendAvailable(), GPUWATCH_NVML_AVAILABLE != 0);
}

/** @test The factory honors explicit backends and resolves AUTO. */
TEST(TelemetryProviderTest, MakeProvider) {
  ProviderConfig cfg{};
  cfg.smiPath = "/nonexistent/nvidia-smi";

  cfg.backend = Backend::SMI;
  EXPECT_EQ(makeProvider(cfg)->name(), "nvidia-smi");

  cfg.backend = Backend::NVML;
  EXPECT_EQ(makeProvider(cfg)->name(), "nvml");

  cfg.backend = Backend::AUTO;
  EXPECT_EQ(makeProvider(cfg)->name(), nvmlBackendAvailable() ? "nvml" : "nvidia-smi");
}

/** @test An SMI provider pointed at nothing fails cleanly. */
TEST(TelemetryProviderTest, SmiMissingExecutable) {
  ProviderConfig cfg{};
  cfg.backend = Backend::SMI;
  cfg.smiPath = "/nonexistent/nvidia-smi";
  EXPECT_EQ(makeProvider(cfg)->poll().status, PollStatus::PROVIDER_MISSING);
}
