#include <catch2/catch_all.hpp>

#include "AcquisitionPlan.h"
#include "ControllerConfig.h"
#include "Error.h"
#include "LogicProgram.h"

#include <limits>
#include <string>
#include <vector>

namespace spim {

namespace {

SPIMError::Code
ValidationCode(const AcquisitionPlan& plan, unsigned numCameras)
{
   try
   {
      ValidatePlan(plan, numCameras);
   }
   catch (const SPIMError& e)
   {
      return e.getCode();
   }
   return SPIMERR_OK;
}

} // anonymous namespace

TEST_CASE("default plan is valid", "[AcquisitionPlan]")
{
   AcquisitionPlan plan;
   CHECK(ValidationCode(plan, 1) == SPIMERR_OK);
}

TEST_CASE("invalid plans", "[AcquisitionPlan]")
{
   AcquisitionPlan plan;

   SECTION("no cameras")
   {
      CHECK(ValidationCode(plan, 0) == SPIMERR_INVALID_PLAN);
   }
   SECTION("zero time points")
   {
      plan.numTimePoints = 0;
      CHECK(ValidationCode(plan, 1) == SPIMERR_INVALID_PLAN);
   }
   SECTION("zero slices")
   {
      plan.numSlices = 0;
      CHECK(ValidationCode(plan, 1) == SPIMERR_INVALID_PLAN);
   }
   SECTION("non-positive exposure")
   {
      plan.exposureMs = GENERATE(0.0, -1.0,
            std::numeric_limits<double>::quiet_NaN(),
            std::numeric_limits<double>::infinity());
      CHECK(ValidationCode(plan, 1) == SPIMERR_INVALID_PLAN);
   }
   SECTION("negative laser pulse")
   {
      plan.laserPulseMs = -0.5;
      CHECK(ValidationCode(plan, 1) == SPIMERR_INVALID_PLAN);
   }
   SECTION("negative interval")
   {
      plan.SetInterval(-1.0);
      CHECK(ValidationCode(plan, 1) == SPIMERR_INVALID_PLAN);
   }
   SECTION("values beyond what the cards can time")
   {
      SECTION("exposure")
      {
         plan.exposureMs = GENERATE(MaxExposureMs + 1.0, 1.0e80);
      }
      SECTION("laser pulse")
      {
         plan.laserPulseMs = GENERATE(MaxExposureMs + 1.0, 1.0e80);
      }
      SECTION("interval")
      {
         plan.SetInterval(GENERATE(MaxIntervalMs + 1.0, 1.0e300));
      }
      SECTION("slice step")
      {
         plan.sliceStepUm = GENERATE(-(MaxSliceStepUm + 1.0), 1.0e80);
      }
      SECTION("slice count")
      {
         plan.numSlices = MaxSlicesPerVolume + 1;
      }
      CHECK(ValidationCode(plan, 1) == SPIMERR_INVALID_PLAN);
   }
   SECTION("duplicate channel names")
   {
      plan.channels.push_back(Channel("GFP", 488, 0));
      plan.channels.push_back(Channel("GFP", 561, 1));
      CHECK(ValidationCode(plan, 2) == SPIMERR_INVALID_PLAN);
   }
   SECTION("empty channel name")
   {
      plan.channels.push_back(Channel("", 488, 0));
      CHECK(ValidationCode(plan, 1) == SPIMERR_INVALID_PLAN);
   }
   SECTION("channel camera out of range")
   {
      plan.channels.push_back(Channel("GFP", 488, 1));
      CHECK(ValidationCode(plan, 1) == SPIMERR_INVALID_PLAN);
      CHECK(ValidationCode(plan, 2) == SPIMERR_OK);
   }
}

TEST_CASE("zero interval is allowed", "[AcquisitionPlan]")
{
   AcquisitionPlan plan;
   plan.SetInterval(0.0);
   CHECK(ValidationCode(plan, 1) == SPIMERR_OK);
   plan.SetInterval(MaxIntervalMs);
   CHECK(ValidationCode(plan, 1) == SPIMERR_OK);
   plan.ClearInterval();
   CHECK_FALSE(plan.hasInterval);
}

TEST_CASE("timing parameters", "[AcquisitionPlan]")
{
   ControllerConfig config;
   config.timing.cameraReadoutMs = 2.0;
   config.timing.delayBeforeSideMs = 0.5;
   config.timing.delayBeforeRepeatMs = 1.0;

   AcquisitionPlan plan;
   plan.numSlices = 10;
   plan.exposureMs = 10.0;

   SECTION("requested exposure above camera minimum")
   {
      TimingParameters t = ComputeTimingParameters(plan, 5.0, config);
      CHECK(t.slicesPerVolume == 10);
      CHECK(t.scanDurationMs == Catch::Approx(12.0));
      CHECK(t.numRepeats == 1);
      CHECK(t.delayBeforeSideMs == Catch::Approx(0.5));
      CHECK(t.delayBeforeRepeatMs == Catch::Approx(1.0));
      CHECK(EstimateVolumeDurationMs(t) == Catch::Approx(120.5));
   }

   SECTION("camera minimum exposure wins")
   {
      TimingParameters t = ComputeTimingParameters(plan, 15.0, config);
      CHECK(t.scanDurationMs == Catch::Approx(17.0));
   }

   SECTION("two sides double the volume")
   {
      TimingParameters t = ComputeTimingParameters(plan, 5.0, config);
      CHECK(t.numSides == 1);
      t.numSides = 2;
      CHECK(EstimateVolumeDurationMs(t) == Catch::Approx(241.0));
   }
}

TEST_CASE("galvo amplitude follows the Z range", "[AcquisitionPlan]")
{
   ControllerConfig config;
   AcquisitionPlan plan;

   SECTION("default calibration")
   {
      plan.numSlices = 10;
      plan.sliceStepUm = 2.0;
      TimingParameters t = ComputeTimingParameters(plan, 0.0, config);
      CHECK(t.galvoAmplitudeDeg == Catch::Approx(0.18));
   }

   SECTION("descending stack sweeps the same range")
   {
      plan.numSlices = 5;
      plan.sliceStepUm = -0.5;
      config.scanner.sliceCalibrationUmPerDeg = 4.0;
      TimingParameters t = ComputeTimingParameters(plan, 0.0, config);
      CHECK(t.galvoAmplitudeDeg == Catch::Approx(0.5));
   }

   SECTION("single slice does not sweep")
   {
      plan.numSlices = 1;
      plan.sliceStepUm = 25.0;
      TimingParameters t = ComputeTimingParameters(plan, 0.0, config);
      CHECK(t.galvoAmplitudeDeg == 0.0);
   }
}

TEST_CASE("volume duration with repeats", "[AcquisitionPlan]")
{
   TimingParameters t;
   t.slicesPerVolume = 4;
   t.scanDurationMs = 5.0;
   t.delayBeforeSideMs = 1.0;
   t.delayBeforeRepeatMs = 10.0;
   t.numRepeats = 3;
   CHECK(EstimateVolumeDurationMs(t) == Catch::Approx(3 * 21.0 + 2 * 10.0));
   t.numRepeats = 0;
   CHECK(EstimateVolumeDurationMs(t) == 0.0);
}

TEST_CASE("single camera volume events", "[AcquisitionPlan]")
{
   AcquisitionPlan plan;
   plan.numSlices = 3;
   plan.sliceStepUm = 0.5;

   std::vector<AcquisitionEvent> events =
      GenerateVolumeEvents(plan, 4, { "Cam" });
   REQUIRE(events.size() == 3);
   for (unsigned i = 0; i < events.size(); ++i)
   {
      CHECK(events[i].timePoint == 4);
      CHECK(events[i].sliceIndex == i);
      CHECK(events[i].cameraLabel == "Cam");
      CHECK(events[i].channel == DefaultChannelName);
      CHECK(events[i].zOffsetUm == Catch::Approx(0.5 * i));
   }
}

TEST_CASE("dual camera volume events are slice-major", "[AcquisitionPlan]")
{
   AcquisitionPlan plan;
   plan.numSlices = 2;
   plan.channels.push_back(Channel("GFP", 488, 0));
   plan.channels.push_back(Channel("RFP", 561, 1));
   plan.channels.push_back(Channel("GFP2", 488, 0));

   std::vector<AcquisitionEvent> events =
      GenerateVolumeEvents(plan, 0, { "CamA", "CamB" });
   REQUIRE(events.size() == 4);
   CHECK(events[0].sliceIndex == 0);
   CHECK(events[0].cameraLabel == "CamA");
   CHECK(events[0].channel == "GFP");
   CHECK(events[1].sliceIndex == 0);
   CHECK(events[1].cameraLabel == "CamB");
   CHECK(events[1].channel == "RFP");
   CHECK(events[2].sliceIndex == 1);
   CHECK(events[2].cameraLabel == "CamA");
   CHECK(events[3].sliceIndex == 1);
   CHECK(events[3].cameraLabel == "CamB");
}

TEST_CASE("camera without channel gets the default channel", "[AcquisitionPlan]")
{
   AcquisitionPlan plan;
   plan.channels.push_back(Channel("RFP", 561, 1));
   std::vector<AcquisitionEvent> events =
      GenerateVolumeEvents(plan, 0, { "CamA", "CamB" });
   REQUIRE(events.size() == 2);
   CHECK(events[0].channel == DefaultChannelName);
   CHECK(events[1].channel == "RFP");
}

TEST_CASE("simple topology has no custom cells", "[LogicProgram]")
{
   ControllerConfig config;
   LogicProgram p = BuildLogicProgram(TriggerTopologySimple, 10.0, 0.0, config);
   CHECK(p.GetTopology() == TriggerTopologySimple);
   CHECK_FALSE(p.HasCustomCells());
}

TEST_CASE("one-shot pulse cells", "[LogicProgram]")
{
   ControllerConfig config;
   LogicProgram p = BuildLogicProgram(TriggerTopologyOneShotPulses,
         10.0, 2.6, config);
   REQUIRE(p.GetCells().size() == 2);

   const LogicCell& laser = p.GetCells()[0];
   CHECK(laser == LogicCell(10, 14, 10, 41, 192, 0)); // floor(2.6 * 4)
   const LogicCell& camera = p.GetCells()[1];
   CHECK(camera == LogicCell(11, 14, 40, 41, 192, 0));
}

TEST_CASE("laser pulse defaults to exposure", "[LogicProgram]")
{
   ControllerConfig config;
   LogicProgram p = BuildLogicProgram(TriggerTopologyOneShotPulses,
         7.5, 0.0, config);
   REQUIRE(p.GetCells().size() == 2);
   CHECK(p.GetCells()[0].config == 30);
   CHECK(p.GetCells()[1].config == 30);
}

TEST_CASE("pulses that do not fit a cell", "[LogicProgram]")
{
   ControllerConfig config;
   const double exposure = GENERATE(0.1, 0.2, 16384.0, 1.0e9);
   try
   {
      BuildLogicProgram(TriggerTopologyOneShotPulses, exposure, 0.0, config);
      FAIL("expected exception");
   }
   catch (const SPIMError& e)
   {
      CHECK(e.getCode() == SPIMERR_INVALID_PLAN);
   }
}

TEST_CASE("set cell keeps index order and replaces duplicates", "[LogicProgram]")
{
   LogicProgram p(TriggerTopologyOneShotPulses);
   p.SetCell(LogicCell(5, 14, 1, 0, 0, 0));
   p.SetCell(LogicCell(2, 14, 2, 0, 0, 0));
   p.SetCell(LogicCell(9, 14, 3, 0, 0, 0));
   p.SetCell(LogicCell(5, 14, 4, 0, 0, 0));
   REQUIRE(p.GetCells().size() == 3);
   CHECK(p.GetCells()[0].index == 2);
   CHECK(p.GetCells()[1].index == 5);
   CHECK(p.GetCells()[1].config == 4);
   CHECK(p.GetCells()[2].index == 9);
}

TEST_CASE("topology names", "[LogicProgram]")
{
   TriggerTopology t = TriggerTopologySimple;
   CHECK(TriggerTopologyFromName("oneShotPulses", t));
   CHECK(t == TriggerTopologyOneShotPulses);
   CHECK(std::string(TriggerTopologyName(t)) == "oneShotPulses");
   CHECK_FALSE(TriggerTopologyFromName("bogus", t));
   CHECK(t == TriggerTopologyOneShotPulses);
}

} // namespace spim
