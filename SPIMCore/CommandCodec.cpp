///////////////////////////////////////////////////////////////////////////////
// FILE:          CommandCodec.cpp
// PROJECT:       SPIMCore
// SUBSYSTEM:     SPIMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Text encoding of controller commands and replies.
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

#include "CommandCodec.h"

#include "CoreUtils.h"
#include "Error.h"

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <cmath>
#include <cstdio>

namespace spim
{

namespace
{

bool
IsValidToken(const std::string& token)
{
   if (token.empty())
      return false;
   for (char c : token)
   {
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '=')
         return false;
   }
   return true;
}

void
RequireToken(const std::string& token, const char* what)
{
   if (!IsValidToken(token))
   {
      throw SPIMError(std::string("Invalid ") + what + " " +
            ToQuotedString(token) + " in controller command",
            SPIMERR_INVALID_COMMAND);
   }
}

std::vector<std::string>
SplitPayload(const std::string& payload)
{
   std::vector<std::string> tokens;
   if (payload.empty())
      return tokens;
   boost::algorithm::split(tokens, payload, boost::algorithm::is_space(),
         boost::algorithm::token_compress_on);
   return tokens;
}

} // anonymous namespace


CommandParam::CommandParam(const std::string& k, int v) :
   key(k), value(std::to_string(v)), isQuery(false), isFlag(false) {}

CommandParam::CommandParam(const std::string& k, long v) :
   key(k), value(std::to_string(v)), isQuery(false), isFlag(false) {}

CommandParam::CommandParam(const std::string& k, unsigned v) :
   key(k), value(std::to_string(v)), isQuery(false), isFlag(false) {}

CommandParam::CommandParam(const std::string& k, unsigned long v) :
   key(k), value(std::to_string(v)), isQuery(false), isFlag(false) {}

CommandParam::CommandParam(const std::string& k, double v) :
   key(k), value(FormatNumber(v)), isQuery(false), isFlag(false) {}


CommandParam
CommandParam::Query(const std::string& k)
{
   CommandParam p(k, std::string());
   p.isQuery = true;
   return p;
}


CommandParam
CommandParam::Flag(const std::string& k)
{
   CommandParam p(k, std::string());
   p.isFlag = true;
   return p;
}


std::string
FormatNumber(double v)
{
   if (!std::isfinite(v))
   {
      throw SPIMError("Cannot encode non-finite value in controller command",
            SPIMERR_INVALID_COMMAND);
   }
   char buf[64];
   const int len = std::snprintf(buf, sizeof(buf), "%.4f", v);
   if (len < 0 || static_cast<std::size_t>(len) >= sizeof(buf))
   {
      throw SPIMError("Value " + ToString(v) + " is too large for a "
            "controller command", SPIMERR_INVALID_COMMAND);
   }
   std::string s(buf, static_cast<std::size_t>(len));
   std::string::size_type dot = s.find('.');
   if (dot != std::string::npos)
   {
      std::string::size_type last = s.find_last_not_of('0');
      if (last == dot)
         s.erase(dot);
      else
         s.erase(last + 1);
   }
   if (s == "-0")
      s = "0";
   return s;
}


std::string
EncodeCommand(int address, const std::string& mnemonic,
      const std::vector<CommandParam>& params)
{
   RequireToken(mnemonic, "mnemonic");

   std::string cmd;
   if (address != NoCardAddress)
   {
      if (address < 0)
      {
         throw SPIMError("Invalid card address " + ToString(address),
               SPIMERR_INVALID_COMMAND);
      }
      cmd = std::to_string(address);
   }
   cmd += mnemonic;

   for (const CommandParam& p : params)
   {
      RequireToken(p.key, "parameter name");
      cmd += ' ';
      cmd += p.key;
      if (p.isQuery)
      {
         cmd += '?';
      }
      else if (!p.isFlag)
      {
         RequireToken(p.value, "parameter value");
         cmd += '=';
         cmd += p.value;
      }
   }
   return cmd;
}


bool
IsNonAcknowledgingCommand(const std::string& command)
{
   std::string::size_type start = command.find_first_not_of("0123456789");
   if (start == std::string::npos)
      return false;
   return command.compare(start, std::string::npos, g_Mnemonic::Halt) == 0;
}


bool
Ack::HasValue(const std::string& key) const
{
   const std::string prefix = key + "=";
   for (const std::string& token : SplitPayload(payload_))
   {
      if (boost::algorithm::starts_with(token, prefix))
         return true;
   }
   return false;
}


std::string
Ack::GetValue(const std::string& key) const
{
   const std::string prefix = key + "=";
   for (const std::string& token : SplitPayload(payload_))
   {
      if (boost::algorithm::starts_with(token, prefix))
         return token.substr(prefix.size());
   }
   throw SPIMError("Reply " + ToQuotedString(payload_) + " has no value for " +
         ToQuotedString(key), SPIMERR_PROTOCOL_MALFORMED);
}


Ack
ParseAck(const std::string& raw)
{
   const std::string reply = boost::algorithm::trim_copy(raw);

   if (boost::algorithm::starts_with(reply, ":A"))
   {
      const std::string rest = reply.substr(2);
      if (rest.empty())
         return Ack();
      if (rest[0] == ' ' || rest[0] == '\t')
         return Ack(boost::algorithm::trim_copy(rest));
   }
   else if (boost::algorithm::starts_with(reply, ":N-"))
   {
      int code = 0;
      try
      {
         code = boost::lexical_cast<int>(reply.substr(2));
      }
      catch (const boost::bad_lexical_cast&)
      {
         throw SPIMError("Malformed fault reply " + ToQuotedString(raw),
               SPIMERR_PROTOCOL_MALFORMED);
      }
      throw SPIMError("Controller reported error " + ToString(code) + " (" +
            DeviceFaultText(code) + ")", SPIMERR_PROTOCOL_DEVICE_ERROR, code);
   }

   throw SPIMError("Malformed reply " + ToQuotedString(raw),
         SPIMERR_PROTOCOL_MALFORMED);
}


const char*
DeviceFaultText(int code)
{
   switch (code)
   {
      case -1: return "Unknown command";
      case -2: return "Unrecognized axis parameter";
      case -3: return "Missing parameters";
      case -4: return "Parameter out of range";
      case -5: return "Operation failed";
      case -6: return "Undefined error";
      case -7: return "Invalid card address";
      case -21: return "Serial command halted";
      default: return "Unknown error code";
   }
}

} // namespace spim
