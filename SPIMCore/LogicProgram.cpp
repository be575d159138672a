///////////////////////////////////////////////////////////////////////////////
// FILE:          LogicProgram.cpp
// PROJECT:       SPIMCore
// SUBSYSTEM:     SPIMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Cell programs for the PLogic card.
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

#include "LogicProgram.h"

#include "ControllerConfig.h"
#include "CoreUtils.h"
#include "Error.h"

#include <algorithm>
#include <cmath>

namespace spim
{

namespace
{

// Cell configuration registers are 16 bits wide
const long MaxCellConfig = 65535;

int
PulseCycles(const char* what, double ms, double pulsesPerMs)
{
   const double cycles = std::floor(ms * pulsesPerMs);
   if (!(cycles >= 1.0) || cycles > MaxCellConfig)
   {
      throw SPIMError(std::string(what) + " pulse of " + ToString(ms) +
            " ms cannot be generated by the logic card (" +
            ToString(cycles) + " clock cycles)", SPIMERR_INVALID_PLAN);
   }
   return static_cast<int>(cycles);
}

} // anonymous namespace


const char*
TriggerTopologyName(TriggerTopology topology)
{
   switch (topology)
   {
      case TriggerTopologySimple: return "simple";
      case TriggerTopologyOneShotPulses: return "oneShotPulses";
   }
   return "(unknown)";
}


bool
TriggerTopologyFromName(const std::string& name, TriggerTopology& topology)
{
   if (name == TriggerTopologyName(TriggerTopologySimple))
      topology = TriggerTopologySimple;
   else if (name == TriggerTopologyName(TriggerTopologyOneShotPulses))
      topology = TriggerTopologyOneShotPulses;
   else
      return false;
   return true;
}


void
LogicProgram::SetCell(const LogicCell& cell)
{
   auto it = std::lower_bound(cells_.begin(), cells_.end(), cell,
         [](const LogicCell& a, const LogicCell& b) { return a.index < b.index; });
   if (it != cells_.end() && it->index == cell.index)
      *it = cell;
   else
      cells_.insert(it, cell);
}


LogicProgram
BuildLogicProgram(TriggerTopology topology, double exposureMs,
      double laserPulseMs, const ControllerConfig& config)
{
   LogicProgram program(topology);
   if (topology == TriggerTopologySimple)
      return program;

   const LogicConstants& lc = config.logic;
   const double laserMs = laserPulseMs > 0.0 ? laserPulseMs : exposureMs;

   program.SetCell(LogicCell(lc.cameraCell, lc.oneShotCellType,
            PulseCycles("Camera", exposureMs, lc.pulsesPerMs),
            lc.triggerTtlAddress, lc.clockAddress, 0));
   program.SetCell(LogicCell(lc.laserCell, lc.oneShotCellType,
            PulseCycles("Laser", laserMs, lc.pulsesPerMs),
            lc.triggerTtlAddress, lc.clockAddress, 0));
   return program;
}

} // namespace spim
