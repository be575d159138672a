#include <catch2/catch_all.hpp>

#include "ControllerConfig.h"
#include "DeviceSession.h"
#include "Error.h"
#include "SequenceProgrammer.h"
#include "StubDevices.h"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace spim {

namespace {

struct ProgrammerFixture
{
   std::shared_ptr<StubConnector> conn = std::make_shared<StubConnector>();
   ControllerConfig config;
   std::shared_ptr<DeviceSession> session;

   ProgrammerFixture()
   {
      session = std::make_shared<DeviceSession>(conn, config.session,
            logging::Logger());
      session->Connect();
   }
};

TimingParameters
TenSliceTiming()
{
   TimingParameters t;
   t.slicesPerVolume = 10;
   t.scanDurationMs = 10.0;
   t.numRepeats = 1;
   t.delayBeforeRepeatMs = 0.0;
   t.delayBeforeSideMs = 0.0;
   t.galvoAmplitudeDeg = 0.18;
   return t;
}

std::size_t
IndexOf(const std::vector<std::string>& cmds, const std::string& cmd)
{
   return static_cast<std::size_t>(
         std::find(cmds.begin(), cmds.end(), cmd) - cmds.begin());
}

} // anonymous namespace

TEST_CASE("simple topology programming sequence", "[SequenceProgrammer]")
{
   ProgrammerFixture f;
   SequenceProgrammer prog(*f.session, f.config, logging::Logger());

   prog.ProgramVolume(TenSliceTiming(), LogicProgram(TriggerTopologySimple));

   const std::vector<std::string> expected{
      "33LASER X=0",
      "\\",
      "33NR X=10 Y=1 F=1",
      "33RT F=0",
      "33NV X=10 Y=0",
      "33SAA Y=0.18",
      "36CCA X=30",
   };
   CHECK(f.conn->GetCommands() == expected);
   CHECK(f.conn->GetUnacknowledgedCommands() ==
         std::vector<std::string>{ "\\" });
}

TEST_CASE("one-shot topology programming sequence", "[SequenceProgrammer]")
{
   ProgrammerFixture f;
   SequenceProgrammer prog(*f.session, f.config, logging::Logger());

   LogicProgram program = BuildLogicProgram(TriggerTopologyOneShotPulses,
         10.0, 5.0, f.config);
   prog.ProgramVolume(TenSliceTiming(), program);

   const std::vector<std::string> expected{
      "33LASER X=0",
      "\\",
      "33NR X=10 Y=1 F=1",
      "33RT F=0",
      "33NV X=10 Y=0",
      "33SAA Y=0.18",
      "36CCA X=30",
      "36M E=10",
      "36CCA Y=14",
      "36CCA Z=20",
      "36CCB X=41 Y=192 Z=0",
      "36M E=11",
      "36CCA Y=14",
      "36CCA Z=40",
      "36CCB X=41 Y=192 Z=0",
      "36CCA X=11",
      "36CCA X=5",
   };
   CHECK(f.conn->GetCommands() == expected);
}

TEST_CASE("command order does not depend on cell count", "[SequenceProgrammer]")
{
   ProgrammerFixture f;
   SequenceProgrammer prog(*f.session, f.config, logging::Logger());

   LogicProgram program(TriggerTopologyOneShotPulses);
   const int numCells = GENERATE(1, 2, 5);
   for (int i = 0; i < numCells; ++i)
      program.SetCell(LogicCell(20 - i, 14, 4 * (i + 1), 41, 192, 0));

   const std::vector<std::string> cmds = prog.LogicCommands(program);
   REQUIRE(cmds.size() == 1 + 4 * static_cast<std::size_t>(numCells) + 2);
   CHECK(cmds.front() == "36CCA X=30");
   CHECK(cmds[cmds.size() - 2] == "36CCA X=11");
   CHECK(cmds.back() == "36CCA X=5");

   // Cells are written in ascending index order
   int lastIndex = -1;
   for (int i = 0; i < numCells; ++i)
   {
      const std::string& move = cmds[1 + 4 * i];
      REQUIRE(move.compare(0, 5, "36M E") == 0);
      int index = std::stoi(move.substr(6));
      CHECK(index > lastIndex);
      lastIndex = index;
   }
}

TEST_CASE("preset table alone decides the presets around the cells",
      "[SequenceProgrammer]")
{
   ProgrammerFixture f;

   SECTION("simple topology has no arm or routing preset")
   {
      SequenceProgrammer prog(*f.session, f.config, logging::Logger());
      CHECK(prog.LogicCommands(LogicProgram(TriggerTopologySimple)) ==
            std::vector<std::string>{ "36CCA X=30" });
   }

   SECTION("a topology without cells still gets its arm and routing presets")
   {
      SequenceProgrammer prog(*f.session, f.config, logging::Logger());
      CHECK(prog.LogicCommands(LogicProgram(TriggerTopologyOneShotPulses)) ==
            std::vector<std::string>{ "36CCA X=30", "36CCA X=11", "36CCA X=5" });
   }

   SECTION("a simple topology with a routing preset configured")
   {
      f.config.presets[TriggerTopologySimple] = PresetSelection(31, NoPreset, 6);
      SequenceProgrammer prog(*f.session, f.config, logging::Logger());
      CHECK(prog.LogicCommands(LogicProgram(TriggerTopologySimple)) ==
            std::vector<std::string>{ "36CCA X=31", "36CCA X=6" });
   }
}

TEST_CASE("timing commands use configured card address",
      "[SequenceProgrammer]")
{
   ProgrammerFixture f;
   f.config.cards.scannerCard = 32;
   SequenceProgrammer prog(*f.session, f.config, logging::Logger());

   TimingParameters t = TenSliceTiming();
   t.scanDurationMs = 12.25;
   t.delayBeforeSideMs = 1.5;
   t.delayBeforeRepeatMs = 3.0;
   t.numSides = 2;
   const std::vector<std::string> expected{
      "32NR X=10 Y=2 F=1",
      "32RT F=3",
      "32NV X=12.25 Y=1.5",
      "32SAA Y=0.18",
   };
   CHECK(prog.TimingCommands(t) == expected);
   CHECK(prog.StartScanCommand() == "32SN");
   CHECK(prog.ScanStateQueryCommand() == "32SN X?");
}

TEST_CASE("safety commands precede every card write", "[SequenceProgrammer]")
{
   ProgrammerFixture f;
   SequenceProgrammer prog(*f.session, f.config, logging::Logger());
   prog.ProgramVolume(TenSliceTiming(), BuildLogicProgram(
            TriggerTopologyOneShotPulses, 10.0, 0.0, f.config));
   const std::vector<std::string> cmds = f.conn->GetCommands();
   CHECK(IndexOf(cmds, "33LASER X=0") == 0);
   CHECK(IndexOf(cmds, "\\") == 1);
   CHECK(IndexOf(cmds, "33NR X=10 Y=1 F=1") == 2);
}

TEST_CASE("slice spacing reaches the scanner as galvo amplitude",
      "[SequenceProgrammer]")
{
   ProgrammerFixture f;
   SequenceProgrammer prog(*f.session, f.config, logging::Logger());

   AcquisitionPlan plan;
   plan.numSlices = 10;
   plan.sliceStepUm = GENERATE(2.0, -2.0);
   const std::vector<std::string> cmds =
      prog.TimingCommands(ComputeTimingParameters(plan, 0.0, f.config));
   REQUIRE(cmds.size() == 4);
   CHECK(cmds.back() == "33SAA Y=0.18");

   plan.sliceStepUm = 0.5;
   CHECK(prog.TimingCommands(ComputeTimingParameters(plan, 0.0, f.config))
         .back() == "33SAA Y=0.045");

   plan.numSlices = 1;
   CHECK(prog.TimingCommands(ComputeTimingParameters(plan, 0.0, f.config))
         .back() == "33SAA Y=0");
}

TEST_CASE("global shutter commands", "[SequenceProgrammer]")
{
   ProgrammerFixture f;
   f.config.cards.logicCard = 35;
   f.config.logic.alwaysOnCell = 15;
   f.config.logic.globalShutterOutput = 34;
   SequenceProgrammer prog(*f.session, f.config, logging::Logger());

   CHECK(prog.GlobalShutterCommands(true) == std::vector<std::string>{
         "35M E=15", "35CCA Y=0 Z=5", "35CCB X=1", "35M E=34", "35CCA Z=15",
         "35SS Z" });
   CHECK(prog.GlobalShutterCommands(false) == std::vector<std::string>{
         "35M E=34", "35CCA Z=0", "35SS Z" });

   prog.SetGlobalShutter(false);
   CHECK(f.conn->GetCommands() == prog.GlobalShutterCommands(false));
}

TEST_CASE("live laser presets", "[SequenceProgrammer]")
{
   ProgrammerFixture f;
   SequenceProgrammer prog(*f.session, f.config, logging::Logger());
   CHECK(prog.LiveLaserCommand(true) == "36CCA X=12");
   CHECK(prog.LiveLaserCommand(false) == "36CCA X=10");
   CHECK(prog.BeamOnCommand() == "33LASER X=1");

   f.conn->replies["36CCA X=10"] = ":N-4";
   CHECK_NOTHROW(prog.SetLiveLaser(true));
   CHECK_THROWS_AS(prog.SetLiveLaser(false), SPIMError);
   CHECK(f.conn->GetCommands() ==
         std::vector<std::string>{ "36CCA X=12", "36CCA X=10" });
}

TEST_CASE("rejected safety command", "[SequenceProgrammer]")
{
   ProgrammerFixture f;
   f.conn->replies["33LASER X=0"] = ":N-1";
   SequenceProgrammer prog(*f.session, f.config, logging::Logger());

   try
   {
      prog.ProgramVolume(TenSliceTiming(), LogicProgram());
      FAIL("expected exception");
   }
   catch (const SPIMError& e)
   {
      CHECK(e.getCode() == SPIMERR_PROGRAM_REJECTED);
      REQUIRE(e.getUnderlyingError() != nullptr);
      CHECK(e.getUnderlyingError()->getCode() == SPIMERR_PROTOCOL_DEVICE_ERROR);
   }
   CHECK(f.conn->GetCommands() == std::vector<std::string>{ "33LASER X=0" });
}

TEST_CASE("failure during logic writes halts and reports partial programming",
      "[SequenceProgrammer]")
{
   ProgrammerFixture f;
   f.conn->replies["36CCA Z=40"] = ":N-4";
   SequenceProgrammer prog(*f.session, f.config, logging::Logger());

   try
   {
      prog.ProgramVolume(TenSliceTiming(), BuildLogicProgram(
               TriggerTopologyOneShotPulses, 10.0, 0.0, f.config));
      FAIL("expected exception");
   }
   catch (const SPIMError& e)
   {
      CHECK(e.getCode() == SPIMERR_PROGRAM_PARTIALLY_PROGRAMMED);
      CHECK(e.getSpecificCode() == SPIMERR_PROGRAM_PARTIALLY_PROGRAMMED);
      CHECK(IsProgramError(e.getCode()));
      REQUIRE(e.getUnderlyingError() != nullptr);
      CHECK(e.hasDeviceFaultCode());
      CHECK(e.getDeviceFaultCode() == -4);
   }

   const std::vector<std::string> cmds = f.conn->GetCommands();
   REQUIRE_FALSE(cmds.empty());
   // Nothing after the failing write except the halt
   CHECK(cmds[cmds.size() - 2] == "36CCA Z=40");
   CHECK(cmds.back() == "\\");
}

TEST_CASE("timeout during timing writes", "[SequenceProgrammer]")
{
   ProgrammerFixture f;
   f.conn->timeouts.insert("33RT F=0");
   SequenceProgrammer prog(*f.session, f.config, logging::Logger());

   try
   {
      prog.ProgramVolume(TenSliceTiming(), LogicProgram());
      FAIL("expected exception");
   }
   catch (const SPIMError& e)
   {
      CHECK(e.getCode() == SPIMERR_PROGRAM_PARTIALLY_PROGRAMMED);
      REQUIRE(e.getUnderlyingError() != nullptr);
      CHECK(e.getUnderlyingError()->getCode() == SPIMERR_SESSION_TIMEOUT);
   }
   CHECK(f.conn->CountCommand("36CCA X=30") == 0);
   CHECK(f.session->IsConnected());
}

TEST_CASE("missing preset fails before any command", "[SequenceProgrammer]")
{
   ProgrammerFixture f;
   f.config.presets.erase(TriggerTopologyOneShotPulses);
   SequenceProgrammer prog(*f.session, f.config, logging::Logger());

   CHECK_THROWS_AS(prog.ProgramVolume(TenSliceTiming(),
            LogicProgram(TriggerTopologyOneShotPulses)), SPIMError);
   CHECK(f.conn->GetCommands().empty());
}

TEST_CASE("halt and reset tolerates failures", "[SequenceProgrammer]")
{
   ProgrammerFixture f;
   f.conn->replies["33LASER X=0"] = ":N-5";
   SequenceProgrammer prog(*f.session, f.config, logging::Logger());

   prog.HaltAndReset();
   CHECK(f.conn->GetCommands() ==
         std::vector<std::string>{ "33LASER X=0", "\\" });
}

} // namespace spim
