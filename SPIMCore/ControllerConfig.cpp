///////////////////////////////////////////////////////////////////////////////
// FILE:          ControllerConfig.cpp
// PROJECT:       SPIMCore
// SUBSYSTEM:     SPIMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Hardware profile of the controller and timing defaults.
//
// LICENSE:       This file is distributed under the BSD license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#include "ControllerConfig.h"

#include "CoreUtils.h"
#include "Error.h"
#include "LogManager.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <sstream>

namespace spim
{

namespace
{

SPIMError
ConfigError(const std::string& path, const std::string& what)
{
   return SPIMError("Invalid configuration value at " +
         ToQuotedString(path) + ": " + what, SPIMERR_INVALID_CONFIGURATION);
}

const nlohmann::json*
FindSection(const nlohmann::json& parent, const char* key,
      const std::string& path)
{
   auto it = parent.find(key);
   if (it == parent.end())
      return nullptr;
   if (!it->is_object())
      throw ConfigError(path + key, "expected an object");
   return &*it;
}

void
Read(const nlohmann::json& obj, const char* key, const std::string& path,
      int& out)
{
   auto it = obj.find(key);
   if (it == obj.end())
      return;
   if (!it->is_number_integer())
      throw ConfigError(path + key, "expected an integer");
   out = it->get<int>();
}

void
Read(const nlohmann::json& obj, const char* key, const std::string& path,
      long& out)
{
   auto it = obj.find(key);
   if (it == obj.end())
      return;
   if (!it->is_number_integer())
      throw ConfigError(path + key, "expected an integer");
   out = it->get<long>();
}

void
Read(const nlohmann::json& obj, const char* key, const std::string& path,
      double& out)
{
   auto it = obj.find(key);
   if (it == obj.end())
      return;
   if (!it->is_number())
      throw ConfigError(path + key, "expected a number");
   out = it->get<double>();
}

void
Read(const nlohmann::json& obj, const char* key, const std::string& path,
      bool& out)
{
   auto it = obj.find(key);
   if (it == obj.end())
      return;
   if (!it->is_boolean())
      throw ConfigError(path + key, "expected true or false");
   out = it->get<bool>();
}

void
Read(const nlohmann::json& obj, const char* key, const std::string& path,
      std::string& out)
{
   auto it = obj.find(key);
   if (it == obj.end())
      return;
   if (!it->is_string())
      throw ConfigError(path + key, "expected a string");
   out = it->get<std::string>();
}

// Presets may be given as null to mean "none"
void
ReadPreset(const nlohmann::json& obj, const char* key, const std::string& path,
      int& out)
{
   auto it = obj.find(key);
   if (it != obj.end() && it->is_null())
   {
      out = NoPreset;
      return;
   }
   Read(obj, key, path, out);
}

nlohmann::json
PresetToJson(int preset)
{
   if (preset == NoPreset)
      return nullptr;
   return preset;
}

} // anonymous namespace


ControllerConfig::ControllerConfig()
{
   presets[TriggerTopologySimple] = PresetSelection(30, NoPreset, NoPreset);
   presets[TriggerTopologyOneShotPulses] = PresetSelection(30, 11, 5);
}


const PresetSelection&
ControllerConfig::GetPresets(TriggerTopology topology) const
{
   auto it = presets.find(topology);
   if (it == presets.end())
   {
      throw SPIMError(std::string("No logic card presets configured for ") +
            "trigger topology " + TriggerTopologyName(topology),
            SPIMERR_INVALID_CONFIGURATION);
   }
   return it->second;
}


void
ControllerConfig::Validate() const
{
   if (cards.scannerCard < 0 || cards.logicCard < 0)
      throw ConfigError("cards", "card addresses must not be negative");
   if (cards.scannerCard == cards.logicCard)
      throw ConfigError("cards", "scanner and logic cards share an address");
   if (!(logic.pulsesPerMs > 0.0) || !std::isfinite(logic.pulsesPerMs))
      throw ConfigError("logic.pulsesPerMs", "must be positive");
   if (logic.laserCell == logic.cameraCell)
      throw ConfigError("logic", "laser and camera cells must differ");
   if (logic.alwaysOnCell == logic.laserCell ||
         logic.alwaysOnCell == logic.cameraCell)
      throw ConfigError("logic.alwaysOnCell",
            "must differ from the laser and camera cells");
   if (logic.liveLaserPreset < 0 || logic.laserOffPreset < 0)
      throw ConfigError("logic", "laser presets must not be negative");
   for (const auto& entry : presets)
   {
      if (entry.second.templatePreset == NoPreset)
      {
         throw ConfigError(std::string("presets.") +
               TriggerTopologyName(entry.first) + ".template",
               "a template preset is required");
      }
   }
   if (!(timing.delayBeforeSideMs >= 0.0) ||
         !(timing.delayBeforeRepeatMs >= 0.0) ||
         !(timing.cameraReadoutMs >= 0.0))
      throw ConfigError("timing", "delays must not be negative");
   if (!(scanner.sliceCalibrationUmPerDeg > 0.0) ||
         !std::isfinite(scanner.sliceCalibrationUmPerDeg))
      throw ConfigError("scanner.sliceCalibrationUmPerDeg", "must be positive");
   if (session.commandTimeoutMs <= 0)
      throw ConfigError("session.commandTimeoutMs", "must be positive");
   if (engine.pollIntervalMs < 0)
      throw ConfigError("engine.pollIntervalMs", "must not be negative");
   if (engine.frameTimeoutMs <= 0)
      throw ConfigError("engine.frameTimeoutMs", "must be positive");
   if (engine.cameraSequenceMargin < 0)
      throw ConfigError("engine.cameraSequenceMargin", "must not be negative");
   LogLevelFromString(logging.level);
}


ControllerConfig
ControllerConfigFromJson(const nlohmann::json& j)
{
   if (!j.is_object())
      throw ConfigError("", "the profile must be a JSON object");

   ControllerConfig config;

   if (const nlohmann::json* s = FindSection(j, "cards", ""))
   {
      Read(*s, "scanner", "cards.", config.cards.scannerCard);
      Read(*s, "logic", "cards.", config.cards.logicCard);
   }

   if (const nlohmann::json* s = FindSection(j, "logic", ""))
   {
      LogicConstants& lc = config.logic;
      Read(*s, "pulsesPerMs", "logic.", lc.pulsesPerMs);
      Read(*s, "triggerTtlAddress", "logic.", lc.triggerTtlAddress);
      Read(*s, "clockAddress", "logic.", lc.clockAddress);
      Read(*s, "laserCell", "logic.", lc.laserCell);
      Read(*s, "cameraCell", "logic.", lc.cameraCell);
      Read(*s, "oneShotCellType", "logic.", lc.oneShotCellType);
      Read(*s, "alwaysOnCell", "logic.", lc.alwaysOnCell);
      Read(*s, "globalShutterOutput", "logic.", lc.globalShutterOutput);
      Read(*s, "liveLaserPreset", "logic.", lc.liveLaserPreset);
      Read(*s, "laserOffPreset", "logic.", lc.laserOffPreset);
   }

   if (const nlohmann::json* s = FindSection(j, "presets", ""))
   {
      for (auto it = s->begin(); it != s->end(); ++it)
      {
         const std::string path = "presets." + it.key();
         TriggerTopology topology;
         if (!TriggerTopologyFromName(it.key(), topology))
            throw ConfigError(path, "unknown trigger topology");
         if (!it->is_object())
            throw ConfigError(path, "expected an object");

         PresetSelection& sel = config.presets[topology];
         ReadPreset(*it, "template", path + ".", sel.templatePreset);
         ReadPreset(*it, "arm", path + ".", sel.armPreset);
         ReadPreset(*it, "routing", path + ".", sel.routingPreset);
      }
   }

   if (const nlohmann::json* s = FindSection(j, "timing", ""))
   {
      Read(*s, "delayBeforeSideMs", "timing.", config.timing.delayBeforeSideMs);
      Read(*s, "delayBeforeRepeatMs", "timing.", config.timing.delayBeforeRepeatMs);
      Read(*s, "cameraReadoutMs", "timing.", config.timing.cameraReadoutMs);
   }

   if (const nlohmann::json* s = FindSection(j, "scanner", ""))
   {
      Read(*s, "sliceCalibrationUmPerDeg", "scanner.",
            config.scanner.sliceCalibrationUmPerDeg);
      Read(*s, "enableBeamForScan", "scanner.", config.scanner.enableBeamForScan);
   }

   if (const nlohmann::json* s = FindSection(j, "session", ""))
      Read(*s, "commandTimeoutMs", "session.", config.session.commandTimeoutMs);

   if (const nlohmann::json* s = FindSection(j, "engine", ""))
   {
      Read(*s, "pollIntervalMs", "engine.", config.engine.pollIntervalMs);
      Read(*s, "frameTimeoutMs", "engine.", config.engine.frameTimeoutMs);
      Read(*s, "cameraSequenceMargin", "engine.",
            config.engine.cameraSequenceMargin);
   }

   if (const nlohmann::json* s = FindSection(j, "logging", ""))
   {
      Read(*s, "level", "logging.", config.logging.level);
      Read(*s, "file", "logging.", config.logging.file);
      Read(*s, "stdErr", "logging.", config.logging.useStdErr);
   }

   config.Validate();
   return config;
}


ControllerConfig
ControllerConfigFromJsonString(const std::string& text)
{
   nlohmann::json j;
   try
   {
      j = nlohmann::json::parse(text);
   }
   catch (const nlohmann::json::parse_error& e)
   {
      throw SPIMError(std::string("Cannot parse hardware profile: ") +
            e.what(), SPIMERR_INVALID_CONFIGURATION);
   }
   return ControllerConfigFromJson(j);
}


ControllerConfig
LoadControllerConfigFile(const std::string& path)
{
   std::ifstream file(path.c_str());
   if (!file)
   {
      throw SPIMError("Cannot open hardware profile " + ToQuotedString(path),
            SPIMERR_FILE_OPEN_FAILED);
   }
   std::ostringstream contents;
   contents << file.rdbuf();

   try
   {
      return ControllerConfigFromJsonString(contents.str());
   }
   catch (const SPIMError& e)
   {
      throw SPIMError("Failed to load hardware profile " +
            ToQuotedString(path), e.getCode(), e);
   }
}


nlohmann::json
ControllerConfigToJson(const ControllerConfig& config)
{
   nlohmann::json j;
   j["cards"]["scanner"] = config.cards.scannerCard;
   j["cards"]["logic"] = config.cards.logicCard;

   j["logic"]["pulsesPerMs"] = config.logic.pulsesPerMs;
   j["logic"]["triggerTtlAddress"] = config.logic.triggerTtlAddress;
   j["logic"]["clockAddress"] = config.logic.clockAddress;
   j["logic"]["laserCell"] = config.logic.laserCell;
   j["logic"]["cameraCell"] = config.logic.cameraCell;
   j["logic"]["oneShotCellType"] = config.logic.oneShotCellType;
   j["logic"]["alwaysOnCell"] = config.logic.alwaysOnCell;
   j["logic"]["globalShutterOutput"] = config.logic.globalShutterOutput;
   j["logic"]["liveLaserPreset"] = config.logic.liveLaserPreset;
   j["logic"]["laserOffPreset"] = config.logic.laserOffPreset;

   for (const auto& entry : config.presets)
   {
      nlohmann::json& p = j["presets"][TriggerTopologyName(entry.first)];
      p["template"] = PresetToJson(entry.second.templatePreset);
      p["arm"] = PresetToJson(entry.second.armPreset);
      p["routing"] = PresetToJson(entry.second.routingPreset);
   }

   j["timing"]["delayBeforeSideMs"] = config.timing.delayBeforeSideMs;
   j["timing"]["delayBeforeRepeatMs"] = config.timing.delayBeforeRepeatMs;
   j["timing"]["cameraReadoutMs"] = config.timing.cameraReadoutMs;

   j["scanner"]["sliceCalibrationUmPerDeg"] =
      config.scanner.sliceCalibrationUmPerDeg;
   j["scanner"]["enableBeamForScan"] = config.scanner.enableBeamForScan;

   j["session"]["commandTimeoutMs"] = config.session.commandTimeoutMs;

   j["engine"]["pollIntervalMs"] = config.engine.pollIntervalMs;
   j["engine"]["frameTimeoutMs"] = config.engine.frameTimeoutMs;
   j["engine"]["cameraSequenceMargin"] = config.engine.cameraSequenceMargin;

   j["logging"]["level"] = config.logging.level;
   j["logging"]["file"] = config.logging.file;
   j["logging"]["stdErr"] = config.logging.useStdErr;
   return j;
}

} // namespace spim
