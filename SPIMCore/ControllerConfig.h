///////////////////////////////////////////////////////////////////////////////
// FILE:          ControllerConfig.h
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

#pragma once

#include "LogicProgram.h"

#include <nlohmann/json_fwd.hpp>

#include <map>
#include <string>

namespace spim
{

const int NoPreset = -1;

struct CardAddresses
{
   int scannerCard = 33;
   int logicCard = 36;
};

struct LogicConstants
{
   double pulsesPerMs = 4.0; // 4 kHz card clock
   int triggerTtlAddress = 41;
   int clockAddress = 192;
   int laserCell = 10;
   int cameraCell = 11;
   int oneShotCellType = 14; // non-retriggerable one-shot

   // Global shutter: a constant-high cell routed to an output BNC
   int alwaysOnCell = 12;
   int globalShutterOutput = 35; // BNC3

   // Laser presets selected outside of hardware-timed runs
   int liveLaserPreset = 12;
   int laserOffPreset = 10;
};

struct ScannerSettings
{
   double sliceCalibrationUmPerDeg = 100.0;
   bool enableBeamForScan = false; // send the beam-on command before each scan
};

/**
 * Presets selected around the custom cells of one topology. A program
 * without custom cells selects only the template preset.
 */
struct PresetSelection
{
   int templatePreset = NoPreset;
   int armPreset = NoPreset;     // "cell-high"
   int routingPreset = NoPreset;

   PresetSelection() {}
   PresetSelection(int templ, int arm, int routing) :
      templatePreset(templ), armPreset(arm), routingPreset(routing)
   {}
};

struct TimingConstants
{
   double delayBeforeSideMs = 0.0;
   double delayBeforeRepeatMs = 0.0;
   double cameraReadoutMs = 0.0;
};

struct SessionSettings
{
   long commandTimeoutMs = 1000;
};

struct EngineSettings
{
   long pollIntervalMs = 1;
   long frameTimeoutMs = 5000;
   long cameraSequenceMargin = 0;
};

struct LoggingSettings
{
   std::string level = "info";
   std::string file;
   bool useStdErr = true;
};

/**
 * Injected hardware configuration. Nothing in the core reads hardware
 * constants from anywhere else.
 */
struct ControllerConfig
{
   CardAddresses cards;
   LogicConstants logic;
   std::map<TriggerTopology, PresetSelection> presets;
   TimingConstants timing;
   ScannerSettings scanner;
   SessionSettings session;
   EngineSettings engine;
   LoggingSettings logging;

   ControllerConfig();

   // Throws SPIMError(SPIMERR_INVALID_CONFIGURATION) if the topology has no
   // preset table entry.
   const PresetSelection& GetPresets(TriggerTopology topology) const;

   // Throws SPIMError(SPIMERR_INVALID_CONFIGURATION)
   void Validate() const;
};

/**
 * Read a hardware profile. Keys absent from the profile keep their default
 * values. Throws SPIMError(SPIMERR_INVALID_CONFIGURATION) for values of the
 * wrong type or out of range.
 */
ControllerConfig ControllerConfigFromJson(const nlohmann::json& j);
ControllerConfig ControllerConfigFromJsonString(const std::string& text);

// Throws SPIMError(SPIMERR_FILE_OPEN_FAILED) if the file cannot be read
ControllerConfig LoadControllerConfigFile(const std::string& path);

nlohmann::json ControllerConfigToJson(const ControllerConfig& config);

} // namespace spim
