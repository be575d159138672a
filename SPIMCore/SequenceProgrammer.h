///////////////////////////////////////////////////////////////////////////////
// FILE:          SequenceProgrammer.h
// PROJECT:       SPIMCore
// SUBSYSTEM:     SPIMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Programs the scanner and logic cards for one hardware-timed volume.
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

#include "AcquisitionPlan.h"
#include "ControllerConfig.h"
#include "LogicProgram.h"
#include "Logging/Logger.h"

#include <string>
#include <vector>

namespace spim
{

class DeviceSession;

/**
 * Turns timing parameters and a logic program into card commands.
 *
 * The order of the commands is fixed by the cards' state machines:
 *
 *  1. disable illumination output
 *  2. halt motion (controller-wide, unacknowledged)
 *  3. scanner timing writes: slice and side count, repeat delay, scan
 *     duration with side delay, galvo amplitude
 *  4. template preset
 *  5. each custom cell in ascending index order: pointer move, type,
 *     configuration, inputs
 *  6. arm preset
 *  7. routing preset
 *
 * Without custom cells, the preset table for the topology leaves out steps
 * 6 and 7. Starting the scan is left to the caller.
 */
class SequenceProgrammer
{
   DeviceSession& session_;
   ControllerConfig config_;
   logging::Logger logger_;

public:
   SequenceProgrammer(DeviceSession& session, const ControllerConfig& config,
         logging::Logger logger);

   /**
    * Program one volume. Blocks until every acknowledged command has been
    * acknowledged.
    *
    * A device fault before anything was written throws
    * SPIMERR_PROGRAM_REJECTED. Any failure once writing has begun halts the
    * scanner (best effort) and throws SPIMERR_PROGRAM_PARTIALLY_PROGRAMMED;
    * the underlying error is chained in both cases.
    */
   void ProgramVolume(const TimingParameters& timing,
         const LogicProgram& program);

   // Disable illumination, then halt motion. Never throws; failures are
   // logged.
   void HaltAndReset();

   // Route the constant-high cell to the shutter output, or ground it, and
   // save the logic card settings
   void SetGlobalShutter(bool open);

   // Select the laser preset used outside hardware-timed runs
   void SetLiveLaser(bool enable);

   // Command strings in programming order, grouped by step
   std::vector<std::string> SafetyCommands() const;
   std::vector<std::string> TimingCommands(const TimingParameters& timing) const;
   std::vector<std::string> LogicCommands(const LogicProgram& program) const;

   std::string StartScanCommand() const;
   std::string ScanStateQueryCommand() const;
   std::string BeamOnCommand() const;
   std::vector<std::string> GlobalShutterCommands(bool open) const;
   std::string LiveLaserCommand(bool enable) const;

private:
   void Issue(const std::string& command);
   void BestEffortHalt();
};

} // namespace spim
