#include <catch2/catch_all.hpp>

#include "DeviceSession.h"
#include "Error.h"
#include "StubDevices.h"

#include <memory>
#include <string>

namespace spim {

namespace {

std::shared_ptr<DeviceSession>
MakeSession(std::shared_ptr<StubConnector> conn)
{
   return std::make_shared<DeviceSession>(conn, SessionSettings(),
         logging::Logger());
}

SPIMError::Code
CodeOfSend(DeviceSession& session, const std::string& cmd)
{
   try
   {
      session.Send(cmd);
   }
   catch (const SPIMError& e)
   {
      return e.getCode();
   }
   return SPIMERR_OK;
}

} // anonymous namespace

TEST_CASE("session starts disconnected", "[DeviceSession]")
{
   auto conn = std::make_shared<StubConnector>();
   auto session = MakeSession(conn);
   CHECK(session->GetState() == DeviceSession::StateDisconnected);
   CHECK_FALSE(session->IsConnected());
   CHECK(CodeOfSend(*session, "33SN") == SPIMERR_SESSION_NOT_CONNECTED);
   CHECK(conn->GetCommands().empty());
}

TEST_CASE("connect and disconnect", "[DeviceSession]")
{
   auto conn = std::make_shared<StubConnector>();
   auto session = MakeSession(conn);
   session->Connect();
   CHECK(conn->open);
   CHECK(session->GetState() == DeviceSession::StateConnected);
   session->Connect(); // no-op
   CHECK(session->GetState() == DeviceSession::StateConnected);
   session->Disconnect();
   CHECK_FALSE(conn->open);
   CHECK(session->GetState() == DeviceSession::StateDisconnected);
}

TEST_CASE("send returns the acknowledgement", "[DeviceSession]")
{
   auto conn = std::make_shared<StubConnector>();
   conn->replies["33SN X?"] = ":A X=R";
   auto session = MakeSession(conn);
   session->Connect();

   Ack ack = session->Send("33SN X?");
   CHECK(ack.GetValue("X") == "R");
   CHECK(session->Send("33SN").GetPayload().empty());
   CHECK(session->GetCommandCount() == 2);
   CHECK(session->GetState() == DeviceSession::StateConnected);
   CHECK(conn->GetCommands() == std::vector<std::string>{ "33SN X?", "33SN" });
}

TEST_CASE("timeout leaves the session usable", "[DeviceSession]")
{
   auto conn = std::make_shared<StubConnector>();
   conn->timeouts.insert("33SN");
   auto session = MakeSession(conn);
   session->Connect();

   CHECK(CodeOfSend(*session, "33SN") == SPIMERR_SESSION_TIMEOUT);
   CHECK(session->GetState() == DeviceSession::StateConnected);
   CHECK(CodeOfSend(*session, "33LASER X=0") == SPIMERR_OK);
}

TEST_CASE("device fault is reported with its code", "[DeviceSession]")
{
   auto conn = std::make_shared<StubConnector>();
   conn->replies["36CCA X=99"] = ":N-4";
   auto session = MakeSession(conn);
   session->Connect();

   try
   {
      session->Send("36CCA X=99");
      FAIL("expected exception");
   }
   catch (const SPIMError& e)
   {
      CHECK(e.getCode() == SPIMERR_PROTOCOL_DEVICE_ERROR);
      CHECK(e.hasDeviceFaultCode());
      CHECK(e.getDeviceFaultCode() == -4);
      CHECK(e.getFullMsg().find("36CCA X=99") != std::string::npos);
   }
   CHECK(session->GetState() == DeviceSession::StateConnected);
   CHECK(session->GetCommandCount() == 0);
}

TEST_CASE("malformed reply", "[DeviceSession]")
{
   auto conn = std::make_shared<StubConnector>();
   conn->replies["33SN"] = "??";
   auto session = MakeSession(conn);
   session->Connect();
   CHECK(CodeOfSend(*session, "33SN") == SPIMERR_PROTOCOL_MALFORMED);
}

TEST_CASE("transport failures", "[DeviceSession]")
{
   auto conn = std::make_shared<StubConnector>();
   auto session = MakeSession(conn);
   session->Connect();

   SECTION("generic transport error")
   {
      conn->queryResult = DEVICE_SERIAL_COMMAND_FAILED;
      CHECK(CodeOfSend(*session, "33SN") == SPIMERR_SESSION_TRANSPORT);
      CHECK(session->GetState() == DeviceSession::StateConnected);
   }

   SECTION("connector lost")
   {
      conn->queryResult = DEVICE_NOT_CONNECTED;
      CHECK(CodeOfSend(*session, "33SN") == SPIMERR_SESSION_NOT_CONNECTED);
      CHECK(session->GetState() == DeviceSession::StateDisconnected);
   }
}

TEST_CASE("concurrent use is rejected as busy", "[DeviceSession]")
{
   auto conn = std::make_shared<StubConnector>();
   auto session = MakeSession(conn);
   session->Connect();

   SPIMError::Code nestedCode = SPIMERR_OK;
   conn->onCommand = [&](const std::string& cmd) {
      if (cmd == "33SN")
         nestedCode = CodeOfSend(*session, "33LASER X=0");
   };
   session->Send("33SN");
   CHECK(nestedCode == SPIMERR_SESSION_BUSY);
   CHECK(session->GetState() == DeviceSession::StateConnected);
   CHECK(conn->CountCommand("33LASER X=0") == 0);
}

TEST_CASE("fire-and-forget uses the unacknowledged path", "[DeviceSession]")
{
   auto conn = std::make_shared<StubConnector>();
   auto session = MakeSession(conn);
   session->Connect();
   session->SendFireAndForget("\\");
   CHECK(conn->GetUnacknowledgedCommands() == std::vector<std::string>{ "\\" });
   CHECK(session->GetCommandCount() == 0);
}

TEST_CASE("timeout must be positive", "[DeviceSession]")
{
   auto conn = std::make_shared<StubConnector>();
   auto session = MakeSession(conn);
   CHECK(session->GetTimeoutMs() == 1000);
   session->SetTimeoutMs(250);
   CHECK(session->GetTimeoutMs() == 250);
   CHECK_THROWS_AS(session->SetTimeoutMs(0), SPIMError);
}

TEST_CASE("session state names", "[DeviceSession]")
{
   CHECK(std::string(SessionStateName(DeviceSession::StateBusy)) == "Busy");
}

} // namespace spim
