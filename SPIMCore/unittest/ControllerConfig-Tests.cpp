#include <catch2/catch_all.hpp>

#include "ControllerConfig.h"
#include "Error.h"
#include "LogManager.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <string>

namespace spim {

namespace {

SPIMError::Code
LoadCode(const std::string& text)
{
   try
   {
      ControllerConfigFromJsonString(text);
   }
   catch (const SPIMError& e)
   {
      return e.getCode();
   }
   return SPIMERR_OK;
}

} // anonymous namespace

TEST_CASE("default hardware profile", "[ControllerConfig]")
{
   ControllerConfig config;
   CHECK(config.cards.scannerCard == 33);
   CHECK(config.cards.logicCard == 36);
   CHECK(config.logic.pulsesPerMs == 4.0);
   CHECK(config.logic.triggerTtlAddress == 41);
   CHECK(config.logic.clockAddress == 192);
   CHECK(config.logic.alwaysOnCell == 12);
   CHECK(config.logic.globalShutterOutput == 35);
   CHECK(config.logic.liveLaserPreset == 12);
   CHECK(config.logic.laserOffPreset == 10);
   CHECK(config.scanner.sliceCalibrationUmPerDeg == 100.0);
   CHECK_FALSE(config.scanner.enableBeamForScan);

   const PresetSelection& simple = config.GetPresets(TriggerTopologySimple);
   CHECK(simple.templatePreset == 30);
   CHECK(simple.armPreset == NoPreset);
   CHECK(simple.routingPreset == NoPreset);

   const PresetSelection& oneShot =
      config.GetPresets(TriggerTopologyOneShotPulses);
   CHECK(oneShot.templatePreset == 30);
   CHECK(oneShot.armPreset == 11);
   CHECK(oneShot.routingPreset == 5);

   CHECK_NOTHROW(config.Validate());
}

TEST_CASE("empty profile keeps defaults", "[ControllerConfig]")
{
   ControllerConfig config = ControllerConfigFromJsonString("{}");
   CHECK(config.cards.scannerCard == 33);
   CHECK(config.session.commandTimeoutMs == 1000);
   CHECK(config.engine.frameTimeoutMs == 5000);
   CHECK(config.logging.level == "info");
   CHECK(config.logging.useStdErr);
}

TEST_CASE("profile overrides", "[ControllerConfig]")
{
   const std::string text = R"({
      "cards": { "scanner": 32, "logic": 35 },
      "logic": { "pulsesPerMs": 8.0, "laserCell": 12, "cameraCell": 13,
                 "alwaysOnCell": 14, "globalShutterOutput": 36 },
      "scanner": { "sliceCalibrationUmPerDeg": 80.5,
                   "enableBeamForScan": true },
      "presets": {
         "oneShotPulses": { "template": 31, "arm": null, "routing": 6 }
      },
      "timing": { "delayBeforeSideMs": 0.25, "cameraReadoutMs": 1.5 },
      "session": { "commandTimeoutMs": 250 },
      "engine": { "pollIntervalMs": 0, "frameTimeoutMs": 800,
                  "cameraSequenceMargin": 4 },
      "logging": { "level": "debug", "file": "spim.log", "stdErr": false }
   })";

   ControllerConfig config = ControllerConfigFromJsonString(text);
   CHECK(config.cards.scannerCard == 32);
   CHECK(config.cards.logicCard == 35);
   CHECK(config.logic.pulsesPerMs == 8.0);
   CHECK(config.logic.laserCell == 12);
   CHECK(config.logic.cameraCell == 13);
   CHECK(config.logic.clockAddress == 192);
   CHECK(config.logic.alwaysOnCell == 14);
   CHECK(config.logic.globalShutterOutput == 36);
   CHECK(config.logic.liveLaserPreset == 12);
   CHECK(config.scanner.sliceCalibrationUmPerDeg == 80.5);
   CHECK(config.scanner.enableBeamForScan);

   const PresetSelection& oneShot =
      config.GetPresets(TriggerTopologyOneShotPulses);
   CHECK(oneShot.templatePreset == 31);
   CHECK(oneShot.armPreset == NoPreset);
   CHECK(oneShot.routingPreset == 6);
   CHECK(config.GetPresets(TriggerTopologySimple).templatePreset == 30);

   CHECK(config.timing.delayBeforeSideMs == 0.25);
   CHECK(config.timing.delayBeforeRepeatMs == 0.0);
   CHECK(config.timing.cameraReadoutMs == 1.5);
   CHECK(config.session.commandTimeoutMs == 250);
   CHECK(config.engine.pollIntervalMs == 0);
   CHECK(config.engine.frameTimeoutMs == 800);
   CHECK(config.engine.cameraSequenceMargin == 4);
   CHECK(config.logging.level == "debug");
   CHECK(config.logging.file == "spim.log");
   CHECK_FALSE(config.logging.useStdErr);
}

TEST_CASE("invalid profiles", "[ControllerConfig]")
{
   const char* text = GENERATE(
      "not json",
      "[]",
      R"({ "cards": 33 })",
      R"({ "cards": { "scanner": "33" } })",
      R"({ "cards": { "scanner": 36 } })",
      R"({ "cards": { "logic": -1 } })",
      R"({ "logic": { "pulsesPerMs": 0 } })",
      R"({ "logic": { "laserCell": 11 } })",
      R"({ "logic": { "alwaysOnCell": 10 } })",
      R"({ "logic": { "laserOffPreset": -2 } })",
      R"({ "scanner": { "sliceCalibrationUmPerDeg": 0 } })",
      R"({ "scanner": { "enableBeamForScan": 1 } })",
      R"({ "presets": { "bogus": { "template": 1 } } })",
      R"({ "presets": { "simple": { "template": null } } })",
      R"({ "presets": { "simple": 30 } })",
      R"({ "timing": { "cameraReadoutMs": -1 } })",
      R"({ "session": { "commandTimeoutMs": 0 } })",
      R"({ "engine": { "frameTimeoutMs": 1.5 } })",
      R"({ "logging": { "level": "loud" } })",
      R"({ "logging": { "stdErr": "yes" } })");
   CHECK(LoadCode(text) == SPIMERR_INVALID_CONFIGURATION);
}

TEST_CASE("missing preset for a topology", "[ControllerConfig]")
{
   ControllerConfig config;
   config.presets.erase(TriggerTopologySimple);
   try
   {
      config.GetPresets(TriggerTopologySimple);
      FAIL("expected exception");
   }
   catch (const SPIMError& e)
   {
      CHECK(e.getCode() == SPIMERR_INVALID_CONFIGURATION);
   }
}

TEST_CASE("profile written as JSON reads back", "[ControllerConfig]")
{
   ControllerConfig config;
   config.cards.scannerCard = 40;
   config.presets[TriggerTopologyOneShotPulses] =
      PresetSelection(29, NoPreset, 7);
   config.engine.cameraSequenceMargin = 2;
   config.scanner.sliceCalibrationUmPerDeg = 62.5;

   nlohmann::json j = ControllerConfigToJson(config);
   CHECK(j["presets"]["oneShotPulses"]["arm"].is_null());

   ControllerConfig back = ControllerConfigFromJson(j);
   CHECK(back.cards.scannerCard == 40);
   CHECK(back.GetPresets(TriggerTopologyOneShotPulses).templatePreset == 29);
   CHECK(back.GetPresets(TriggerTopologyOneShotPulses).armPreset == NoPreset);
   CHECK(back.GetPresets(TriggerTopologyOneShotPulses).routingPreset == 7);
   CHECK(back.engine.cameraSequenceMargin == 2);
   CHECK(back.scanner.sliceCalibrationUmPerDeg == 62.5);
}

TEST_CASE("load profile from file", "[ControllerConfig]")
{
   SECTION("missing file")
   {
      try
      {
         LoadControllerConfigFile("no_such_dir/no_such_profile.json");
         FAIL("expected exception");
      }
      catch (const SPIMError& e)
      {
         CHECK(e.getCode() == SPIMERR_FILE_OPEN_FAILED);
      }
   }

   SECTION("file with errors")
   {
      const std::string path = "ControllerConfig-Tests-bad.json";
      {
         std::ofstream out(path.c_str());
         out << R"({ "cards": { "scanner": "x" } })";
      }
      try
      {
         LoadControllerConfigFile(path);
         FAIL("expected exception");
      }
      catch (const SPIMError& e)
      {
         CHECK(e.getCode() == SPIMERR_INVALID_CONFIGURATION);
         CHECK(e.getFullMsg().find("cards.scanner") != std::string::npos);
      }
      std::remove(path.c_str());
   }

   SECTION("good file")
   {
      const std::string path = "ControllerConfig-Tests-good.json";
      {
         std::ofstream out(path.c_str());
         out << R"({ "cards": { "scanner": 31 } })";
      }
      CHECK(LoadControllerConfigFile(path).cards.scannerCard == 31);
      std::remove(path.c_str());
   }
}

TEST_CASE("log level names", "[LogManager]")
{
   CHECK(LogLevelFromString("trace") == logging::LogLevelTrace);
   CHECK(LogLevelFromString("warning") == logging::LogLevelWarning);
   CHECK(std::string(StringForLogLevel(logging::LogLevelError)) == "error");
   CHECK_THROWS_AS(LogLevelFromString("verbose"), SPIMError);
}

} // namespace spim
