///////////////////////////////////////////////////////////////////////////////
// FILE:          SequenceProgrammer.cpp
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

#include "SequenceProgrammer.h"

#include "CommandCodec.h"
#include "DeviceSession.h"
#include "Error.h"

namespace spim
{

namespace
{

// Constant-high cell driving the global shutter output
const int ConstantCellType = 0;
const int ConstantCellConfig = 5;
const int LogicHighInput = 1;
const int LogicLowSource = 0;

} // anonymous namespace


SequenceProgrammer::SequenceProgrammer(DeviceSession& session,
      const ControllerConfig& config, logging::Logger logger) :
   session_(session),
   config_(config),
   logger_(logger)
{}


std::vector<std::string>
SequenceProgrammer::SafetyCommands() const
{
   std::vector<std::string> cmds;
   cmds.push_back(EncodeCommand(config_.cards.scannerCard, g_Mnemonic::Laser,
            { CommandParam("X", 0) }));
   cmds.push_back(EncodeCommand(NoCardAddress, g_Mnemonic::Halt));
   return cmds;
}


std::vector<std::string>
SequenceProgrammer::TimingCommands(const TimingParameters& timing) const
{
   const int addr = config_.cards.scannerCard;
   std::vector<std::string> cmds;
   cmds.push_back(EncodeCommand(addr, g_Mnemonic::SliceCount,
            { CommandParam("X", timing.slicesPerVolume),
              CommandParam("Y", timing.numSides),
              CommandParam("F", timing.numRepeats) }));
   cmds.push_back(EncodeCommand(addr, g_Mnemonic::RepeatDelay,
            { CommandParam("F", timing.delayBeforeRepeatMs) }));
   cmds.push_back(EncodeCommand(addr, g_Mnemonic::ScanTiming,
            { CommandParam("X", timing.scanDurationMs),
              CommandParam("Y", timing.delayBeforeSideMs) }));
   cmds.push_back(EncodeCommand(addr, g_Mnemonic::Amplitude,
            { CommandParam("Y", timing.galvoAmplitudeDeg) }));
   return cmds;
}


std::vector<std::string>
SequenceProgrammer::LogicCommands(const LogicProgram& program) const
{
   const int addr = config_.cards.logicCard;
   const PresetSelection& presets = config_.GetPresets(program.GetTopology());

   std::vector<std::string> cmds;
   cmds.push_back(EncodeCommand(addr, g_Mnemonic::CellAccess,
            { CommandParam("X", presets.templatePreset) }));

   for (const LogicCell& cell : program.GetCells())
   {
      cmds.push_back(EncodeCommand(addr, g_Mnemonic::MovePointer,
               { CommandParam("E", cell.index) }));
      cmds.push_back(EncodeCommand(addr, g_Mnemonic::CellAccess,
               { CommandParam("Y", cell.type) }));
      cmds.push_back(EncodeCommand(addr, g_Mnemonic::CellAccess,
               { CommandParam("Z", cell.config) }));
      cmds.push_back(EncodeCommand(addr, g_Mnemonic::CellInputs,
               { CommandParam("X", cell.input1),
                 CommandParam("Y", cell.input2),
                 CommandParam("Z", cell.input3) }));
   }

   if (presets.armPreset != NoPreset)
   {
      cmds.push_back(EncodeCommand(addr, g_Mnemonic::CellAccess,
               { CommandParam("X", presets.armPreset) }));
   }
   if (presets.routingPreset != NoPreset)
   {
      cmds.push_back(EncodeCommand(addr, g_Mnemonic::CellAccess,
               { CommandParam("X", presets.routingPreset) }));
   }
   return cmds;
}


std::string
SequenceProgrammer::StartScanCommand() const
{
   return EncodeCommand(config_.cards.scannerCard, g_Mnemonic::ScanState);
}


std::string
SequenceProgrammer::ScanStateQueryCommand() const
{
   return EncodeCommand(config_.cards.scannerCard, g_Mnemonic::ScanState,
         { CommandParam::Query("X") });
}


std::string
SequenceProgrammer::BeamOnCommand() const
{
   return EncodeCommand(config_.cards.scannerCard, g_Mnemonic::Laser,
         { CommandParam("X", 1) });
}


std::vector<std::string>
SequenceProgrammer::GlobalShutterCommands(bool open) const
{
   const int addr = config_.cards.logicCard;
   const LogicConstants& lc = config_.logic;

   std::vector<std::string> cmds;
   if (open)
   {
      cmds.push_back(EncodeCommand(addr, g_Mnemonic::MovePointer,
               { CommandParam("E", lc.alwaysOnCell) }));
      cmds.push_back(EncodeCommand(addr, g_Mnemonic::CellAccess,
               { CommandParam("Y", ConstantCellType),
                 CommandParam("Z", ConstantCellConfig) }));
      cmds.push_back(EncodeCommand(addr, g_Mnemonic::CellInputs,
               { CommandParam("X", LogicHighInput) }));
   }
   cmds.push_back(EncodeCommand(addr, g_Mnemonic::MovePointer,
            { CommandParam("E", lc.globalShutterOutput) }));
   cmds.push_back(EncodeCommand(addr, g_Mnemonic::CellAccess,
            { CommandParam("Z", open ? lc.alwaysOnCell : LogicLowSource) }));
   cmds.push_back(EncodeCommand(addr, g_Mnemonic::SaveSettings,
            { CommandParam::Flag("Z") }));
   return cmds;
}


std::string
SequenceProgrammer::LiveLaserCommand(bool enable) const
{
   const int preset = enable ? config_.logic.liveLaserPreset :
      config_.logic.laserOffPreset;
   return EncodeCommand(config_.cards.logicCard, g_Mnemonic::CellAccess,
         { CommandParam("X", preset) });
}


void
SequenceProgrammer::Issue(const std::string& command)
{
   if (IsNonAcknowledgingCommand(command))
      session_.SendFireAndForget(command);
   else
      session_.Send(command);
}


void
SequenceProgrammer::ProgramVolume(const TimingParameters& timing,
      const LogicProgram& program)
{
   // Compile everything first so that an encoding or configuration error
   // cannot leave the cards half written.
   const std::vector<std::string> safety = SafetyCommands();
   const std::vector<std::string> timingCmds = TimingCommands(timing);
   const std::vector<std::string> logicCmds = LogicCommands(program);

   LOG_DEBUG(logger_) << "Programming volume: " << timing.slicesPerVolume <<
      " slices, scan duration " << timing.scanDurationMs << " ms, " <<
      program.GetCells().size() << " custom cell(s), topology " <<
      TriggerTopologyName(program.GetTopology());

   try
   {
      for (const std::string& cmd : safety)
         Issue(cmd);
   }
   catch (const SPIMError& e)
   {
      if (e.getCode() != SPIMERR_PROTOCOL_DEVICE_ERROR)
         throw;
      throw SPIMError("Controller rejected the safety commands",
            SPIMERR_PROGRAM_REJECTED, e);
   }

   std::string step;
   try
   {
      step = "scanner timing";
      for (const std::string& cmd : timingCmds)
         Issue(cmd);
      step = "logic card";
      for (const std::string& cmd : logicCmds)
         Issue(cmd);
   }
   catch (const SPIMError& e)
   {
      LOG_ERROR(logger_) << "Programming failed during " << step <<
         " writes: " << e.getFullMsg();
      BestEffortHalt();
      throw SPIMError("Volume partially programmed (failed during " + step +
            " writes)", SPIMERR_PROGRAM_PARTIALLY_PROGRAMMED, e);
   }

   LOG_DEBUG(logger_) << "Volume programmed";
}


void
SequenceProgrammer::SetGlobalShutter(bool open)
{
   const std::vector<std::string> cmds = GlobalShutterCommands(open);
   for (const std::string& cmd : cmds)
      Issue(cmd);
   LOG_INFO(logger_) << "Global shutter " << (open ? "opened" : "closed");
}


void
SequenceProgrammer::SetLiveLaser(bool enable)
{
   Issue(LiveLaserCommand(enable));
   LOG_INFO(logger_) << "Live laser output " <<
      (enable ? "enabled" : "disabled");
}


void
SequenceProgrammer::BestEffortHalt()
{
   try
   {
      session_.SendFireAndForget(EncodeCommand(NoCardAddress, g_Mnemonic::Halt));
   }
   catch (const SPIMError& e)
   {
      LOG_ERROR(logger_) << "Halt after failed programming also failed: " <<
         e.getFullMsg();
   }
}


void
SequenceProgrammer::HaltAndReset()
{
   for (const std::string& cmd : SafetyCommands())
   {
      try
      {
         Issue(cmd);
      }
      catch (const SPIMError& e)
      {
         LOG_ERROR(logger_) << "Reset command " << cmd << " failed: " <<
            e.getFullMsg();
      }
   }
   LOG_INFO(logger_) << "Illumination disabled and motion halted";
}

} // namespace spim
