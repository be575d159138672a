///////////////////////////////////////////////////////////////////////////////
// FILE:          LogicProgram.h
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

#pragma once

#include <string>
#include <vector>

namespace spim
{

struct ControllerConfig;

/**
 * How the logic card turns the scanner's per-slice trigger into camera and
 * laser pulses.
 */
enum TriggerTopology
{
   // The scanner trigger is routed straight to the camera; no custom cells.
   TriggerTopologySimple,
   // Camera and laser each get a one-shot pulse cell clocked by the card's
   // 4 kHz clock.
   TriggerTopologyOneShotPulses,
};

const char* TriggerTopologyName(TriggerTopology topology);

// Returns false if the name is not recognized
bool TriggerTopologyFromName(const std::string& name,
      TriggerTopology& topology);


struct LogicCell
{
   int index;
   int type;
   int config;
   int input1;
   int input2;
   int input3;

   LogicCell() : index(0), type(0), config(0), input1(0), input2(0), input3(0) {}
   LogicCell(int idx, int cellType, int cellConfig, int in1, int in2, int in3) :
      index(idx), type(cellType), config(cellConfig),
      input1(in1), input2(in2), input3(in3)
   {}

   bool operator==(const LogicCell& rhs) const
   {
      return index == rhs.index && type == rhs.type && config == rhs.config &&
         input1 == rhs.input1 && input2 == rhs.input2 && input3 == rhs.input3;
   }
};


/**
 * A set of custom cells for one trigger topology.
 *
 * Cells are kept in ascending index order, which is the order in which they
 * must be written to the card. Setting a cell whose index is already present
 * replaces it.
 */
class LogicProgram
{
   TriggerTopology topology_;
   std::vector<LogicCell> cells_;

public:
   explicit LogicProgram(TriggerTopology topology = TriggerTopologySimple) :
      topology_(topology)
   {}

   TriggerTopology GetTopology() const { return topology_; }

   void SetCell(const LogicCell& cell);
   const std::vector<LogicCell>& GetCells() const { return cells_; }
   bool HasCustomCells() const { return !cells_.empty(); }
};


/**
 * Build the cell program for a topology.
 *
 * Pulse widths are converted to clock cycles (truncating). Throws
 * SPIMError(SPIMERR_INVALID_PLAN) if a pulse does not fit in a cell's
 * configuration register.
 */
LogicProgram BuildLogicProgram(TriggerTopology topology, double exposureMs,
      double laserPulseMs, const ControllerConfig& config);

} // namespace spim
