///////////////////////////////////////////////////////////////////////////////
// FILE:          CommandCodec.h
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

#pragma once

#include <string>
#include <vector>

namespace spim
{

// Grammar: [address][mnemonic] [KEY=value ...]
//
// The address is the decimal card address, left out for controller-wide
// commands. Parameters are separated by single spaces. Replies are ":A"
// optionally followed by a payload, or ":N-<code>" for a fault.

const int NoCardAddress = -1;

namespace g_Mnemonic
{
   const char* const Halt = "\\";          // controller-wide, never replies
   const char* const Laser = "LASER";      // X=0 disables illumination output
   const char* const SliceCount = "NR";    // X=slices Y=sides F=repeats
   const char* const RepeatDelay = "RT";   // F=delay before repeat (ms)
   const char* const ScanTiming = "NV";    // X=scan duration Y=delay before side (ms)
   const char* const Amplitude = "SAA";    // Y=galvo amplitude (deg)
   const char* const ScanState = "SN";     // bare: start scan; X?: query state
   const char* const CellAccess = "CCA";   // X=preset Y=type Z=configuration
   const char* const CellInputs = "CCB";   // X, Y, Z=input addresses
   const char* const MovePointer = "M";    // E=cell
   const char* const SaveSettings = "SS";  // Z: save to card flash
}

// Scan states reported by "SN X?"
namespace g_ScanState
{
   const char* const Idle = "I";
   const char* const Armed = "A";
   const char* const Running = "R";
}

struct CommandParam
{
   std::string key;
   std::string value;
   bool isQuery;
   bool isFlag;

   CommandParam(const std::string& k, const std::string& v) :
      key(k), value(v), isQuery(false), isFlag(false) {}
   CommandParam(const std::string& k, const char* v) :
      key(k), value(v), isQuery(false), isFlag(false) {}
   CommandParam(const std::string& k, int v);
   CommandParam(const std::string& k, long v);
   CommandParam(const std::string& k, unsigned v);
   CommandParam(const std::string& k, unsigned long v);
   CommandParam(const std::string& k, double v);

   // Encodes as "KEY?"
   static CommandParam Query(const std::string& k);
   // Encodes as the bare key ("SS Z")
   static CommandParam Flag(const std::string& k);
};

// Fixed-point with at most 4 decimals and no trailing zeros ("10", "2.5").
// Throws SPIMError(SPIMERR_INVALID_COMMAND) for values that are not finite
// or too large to encode.
std::string FormatNumber(double v);

/**
 * Build a command string. Throws SPIMError(SPIMERR_INVALID_COMMAND) if a
 * token is empty or contains whitespace or '='.
 */
std::string EncodeCommand(int address, const std::string& mnemonic,
      const std::vector<CommandParam>& params = std::vector<CommandParam>());

// True for commands the controller executes without sending a reply
bool IsNonAcknowledgingCommand(const std::string& command);


class Ack
{
   std::string payload_;

public:
   Ack() {}
   explicit Ack(const std::string& payload) : payload_(payload) {}

   const std::string& GetPayload() const { return payload_; }

   bool HasValue(const std::string& key) const;

   // Value of "KEY=value" in the payload. Throws
   // SPIMError(SPIMERR_PROTOCOL_MALFORMED) if absent.
   std::string GetValue(const std::string& key) const;
};

/**
 * Decode one reply line (terminators may or may not be present).
 *
 * Throws SPIMError(SPIMERR_PROTOCOL_DEVICE_ERROR) carrying the fault code
 * for ":N-<code>", and SPIMError(SPIMERR_PROTOCOL_MALFORMED) for anything
 * else that is not an acknowledgement.
 */
Ack ParseAck(const std::string& raw);

const char* DeviceFaultText(int code);

} // namespace spim
