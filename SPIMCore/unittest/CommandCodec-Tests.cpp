#include <catch2/catch_all.hpp>

#include "CommandCodec.h"
#include "Error.h"

#include <limits>

namespace spim {

TEST_CASE("encode command without parameters", "[CommandCodec]")
{
   CHECK(EncodeCommand(33, g_Mnemonic::ScanState) == "33SN");
   CHECK(EncodeCommand(NoCardAddress, g_Mnemonic::Halt) == "\\");
}

TEST_CASE("encode command with parameters", "[CommandCodec]")
{
   CHECK(EncodeCommand(33, g_Mnemonic::Laser, { CommandParam("X", 0) }) ==
         "33LASER X=0");
   CHECK(EncodeCommand(33, g_Mnemonic::SliceCount,
            { CommandParam("X", 10u), CommandParam("F", 1u) }) ==
         "33NR X=10 F=1");
   CHECK(EncodeCommand(36, g_Mnemonic::CellInputs,
            { CommandParam("X", 41), CommandParam("Y", 192),
              CommandParam("Z", 0) }) ==
         "36CCB X=41 Y=192 Z=0");
   CHECK(EncodeCommand(33, g_Mnemonic::ScanTiming,
            { CommandParam("X", 12.5) }) == "33NV X=12.5");
}

TEST_CASE("encode query parameter", "[CommandCodec]")
{
   CHECK(EncodeCommand(33, g_Mnemonic::ScanState,
            { CommandParam::Query("X") }) == "33SN X?");
}

TEST_CASE("encode bare flag parameter", "[CommandCodec]")
{
   CHECK(EncodeCommand(36, g_Mnemonic::SaveSettings,
            { CommandParam::Flag("Z") }) == "36SS Z");
   CHECK(EncodeCommand(36, g_Mnemonic::CellAccess,
            { CommandParam("Y", 0), CommandParam("Z", 5) }) ==
         "36CCA Y=0 Z=5");
}

TEST_CASE("encode rejects malformed tokens", "[CommandCodec]")
{
   SECTION("empty mnemonic")
   {
      CHECK_THROWS_AS(EncodeCommand(33, ""), SPIMError);
   }
   SECTION("mnemonic with whitespace")
   {
      try
      {
         EncodeCommand(33, "N R");
         FAIL("expected exception");
      }
      catch (const SPIMError& e)
      {
         CHECK(e.getCode() == SPIMERR_INVALID_COMMAND);
      }
   }
   SECTION("empty parameter name")
   {
      CHECK_THROWS_AS(EncodeCommand(33, "NR", { CommandParam("", 1) }),
            SPIMError);
   }
   SECTION("parameter value with '='")
   {
      CHECK_THROWS_AS(EncodeCommand(33, "NR", { CommandParam("X", "a=b") }),
            SPIMError);
   }
   SECTION("empty parameter value")
   {
      CHECK_THROWS_AS(EncodeCommand(33, "NR", { CommandParam("X", "") }),
            SPIMError);
   }
   SECTION("negative card address")
   {
      CHECK_THROWS_AS(EncodeCommand(-5, "NR"), SPIMError);
   }
}

TEST_CASE("format number", "[CommandCodec]")
{
   CHECK(FormatNumber(10.0) == "10");
   CHECK(FormatNumber(2.5) == "2.5");
   CHECK(FormatNumber(0.0) == "0");
   CHECK(FormatNumber(-0.0) == "0");
   CHECK(FormatNumber(1.23456) == "1.2346");
   CHECK(FormatNumber(0.1) == "0.1");
   CHECK(FormatNumber(-3.25) == "-3.25");
   CHECK(FormatNumber(1.0e15) == "1000000000000000");
}

TEST_CASE("numbers that cannot be encoded are rejected", "[CommandCodec]")
{
   const double v = GENERATE(1.0e80, -1.0e80,
         std::numeric_limits<double>::quiet_NaN(),
         std::numeric_limits<double>::infinity());
   try
   {
      FormatNumber(v);
      FAIL("expected exception");
   }
   catch (const SPIMError& e)
   {
      CHECK(e.getCode() == SPIMERR_INVALID_COMMAND);
   }
   CHECK_THROWS_AS(EncodeCommand(33, g_Mnemonic::ScanTiming,
            { CommandParam("X", v) }), SPIMError);
}

TEST_CASE("halt is the only non-acknowledging command", "[CommandCodec]")
{
   CHECK(IsNonAcknowledgingCommand("\\"));
   CHECK_FALSE(IsNonAcknowledgingCommand("33SN"));
   CHECK_FALSE(IsNonAcknowledgingCommand("33LASER X=0"));
   CHECK_FALSE(IsNonAcknowledgingCommand("33"));
}

TEST_CASE("parse plain acknowledgement", "[CommandCodec]")
{
   const char* raw = GENERATE(":A", ":A\r\n", " :A ", ":A\r");
   Ack ack = ParseAck(raw);
   CHECK(ack.GetPayload().empty());
   CHECK_FALSE(ack.HasValue("X"));
}

TEST_CASE("parse acknowledgement with payload", "[CommandCodec]")
{
   Ack ack = ParseAck(":A X=R Y=12\r\n");
   CHECK(ack.GetPayload() == "X=R Y=12");
   CHECK(ack.HasValue("X"));
   CHECK(ack.GetValue("X") == "R");
   CHECK(ack.GetValue("Y") == "12");
   CHECK_FALSE(ack.HasValue("Z"));
   CHECK_THROWS_AS(ack.GetValue("Z"), SPIMError);
}

TEST_CASE("parse device fault", "[CommandCodec]")
{
   try
   {
      ParseAck(":N-4\r\n");
      FAIL("expected exception");
   }
   catch (const SPIMError& e)
   {
      CHECK(e.getCode() == SPIMERR_PROTOCOL_DEVICE_ERROR);
      REQUIRE(e.hasDeviceFaultCode());
      CHECK(e.getDeviceFaultCode() == -4);
   }
}

TEST_CASE("parse malformed replies", "[CommandCodec]")
{
   const char* raw = GENERATE("", "A", ":AX=1", ":N-", ":N-abc", "garbage",
         ":B");
   try
   {
      ParseAck(raw);
      FAIL("expected exception");
   }
   catch (const SPIMError& e)
   {
      CHECK(e.getCode() == SPIMERR_PROTOCOL_MALFORMED);
      CHECK_FALSE(e.hasDeviceFaultCode());
   }
}

TEST_CASE("device fault text", "[CommandCodec]")
{
   CHECK(std::string(DeviceFaultText(-1)) == "Unknown command");
   CHECK(std::string(DeviceFaultText(-999)) == "Unknown error code");
}

} // namespace spim
