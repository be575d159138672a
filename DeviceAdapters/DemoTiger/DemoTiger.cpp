///////////////////////////////////////////////////////////////////////////////
// FILE:          DemoTiger.cpp
// PROJECT:       SPIMCore
// SUBSYSTEM:     DeviceAdapters
//-----------------------------------------------------------------------------
// DESCRIPTION:   Demo Tiger controller connector
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

#include "DemoTiger.h"

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <cctype>
#include <cmath>

const char* g_DemoTigerName = "DemoTiger";
const char* g_DemoCameraName = "DemoCamera";

namespace
{

// Controller fault replies
const char* const g_Ack = ":A";
const int ERR_UNKNOWN_COMMAND = -1;
const int ERR_MISSING_PARAMETERS = -3;
const int ERR_PARAMETER_OUT_OF_RANGE = -4;
const int ERR_OPERATION_FAILED = -5;
const int ERR_INVALID_CARD_ADDRESS = -7;

std::string Fault(int code)
{
   return ":N" + std::to_string(code);
}

bool HasParam(const std::map<std::string, std::string>& params,
      const std::string& key)
{
   return params.find(key) != params.end();
}

// A key given without a value where one is required
struct MissingValue {};

// Throws MissingValue for a bare key and boost::bad_lexical_cast for
// non-numeric values
double NumericParam(const std::map<std::string, std::string>& params,
      const std::string& key)
{
   const std::string& value = params.find(key)->second;
   if (value.empty())
      throw MissingValue();
   return boost::lexical_cast<double>(value);
}

long IntegerParam(const std::map<std::string, std::string>& params,
      const std::string& key)
{
   const double v = NumericParam(params, key);
   if (v != std::floor(v))
      throw boost::bad_lexical_cast();
   return static_cast<long>(v);
}

} // namespace


DemoTigerConnector::DemoTigerConnector(int scannerCard, int logicCard,
      spim::logging::Logger logger) :
   scannerCard_(scannerCard),
   logicCard_(logicCard),
   logger_(logger),
   open_(false),
   slices_(0),
   sides_(1),
   repeats_(1),
   scanDurationMs_(0.0),
   delayBeforeSideMs_(0.0),
   delayBeforeRepeatMs_(0.0),
   amplitudeDeg_(0.0),
   scanState_('I'),
   laserEnabled_(true),
   pointer_(0),
   saveCount_(0)
{
}

int DemoTigerConnector::Open()
{
   std::lock_guard<std::mutex> lock(mutex_);
   open_ = true;
   LOG_INFO(logger_) << g_DemoTigerName << " opened (scanner card " <<
      scannerCard_ << ", logic card " << logicCard_ << ")";
   return DEVICE_OK;
}

int DemoTigerConnector::Close()
{
   std::lock_guard<std::mutex> lock(mutex_);
   open_ = false;
   return DEVICE_OK;
}

bool DemoTigerConnector::IsOpen() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return open_;
}

int DemoTigerConnector::SendQuery(const std::string& command,
      std::string& answer, long)
{
   if (!IsOpen())
      return DEVICE_NOT_CONNECTED;

   answer = Execute(command);
   if (answer == g_Ack && command == std::to_string(scannerCard_) + "SN")
      StartScan();
   return DEVICE_OK;
}

int DemoTigerConnector::Send(const std::string& command)
{
   if (!IsOpen())
      return DEVICE_NOT_CONNECTED;

   const std::string reply = Execute(command);
   if (reply != g_Ack)
      LOG_WARNING(logger_) << "Unacknowledged command " << command <<
         " was rejected (" << reply << ")";
   return DEVICE_OK;
}

void DemoTigerConnector::AttachCamera(std::shared_ptr<DemoCamera> camera)
{
   std::lock_guard<std::mutex> lock(mutex_);
   cameras_.push_back(camera);
}

void DemoTigerConnector::InjectFault(const std::string& command, int faultCode)
{
   std::lock_guard<std::mutex> lock(mutex_);
   faults_[command] = faultCode;
}

long DemoTigerConnector::GetSliceCount() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return slices_;
}

long DemoTigerConnector::GetRepeatCount() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return repeats_;
}

long DemoTigerConnector::GetSideCount() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return sides_;
}

double DemoTigerConnector::GetScanDurationMs() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return scanDurationMs_;
}

double DemoTigerConnector::GetDelayBeforeSideMs() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return delayBeforeSideMs_;
}

double DemoTigerConnector::GetAmplitudeDeg() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return amplitudeDeg_;
}

int DemoTigerConnector::GetLogicSaveCount() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return saveCount_;
}

char DemoTigerConnector::GetScanState() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return scanState_;
}

bool DemoTigerConnector::IsLaserEnabled() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return laserEnabled_;
}

std::vector<int> DemoTigerConnector::GetSelectedPresets() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return presets_;
}

bool DemoTigerConnector::GetCell(int index, Cell& cell) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   auto it = cells_.find(index);
   if (it == cells_.end())
      return false;
   cell = it->second;
   return true;
}

std::string DemoTigerConnector::Execute(const std::string& command)
{
   std::lock_guard<std::mutex> lock(mutex_);

   auto fault = faults_.find(command);
   if (fault != faults_.end())
   {
      const int code = fault->second;
      faults_.erase(fault);
      return Fault(code);
   }

   std::vector<std::string> tokens;
   const std::string trimmed = boost::algorithm::trim_copy(command);
   if (trimmed.empty())
      return Fault(ERR_UNKNOWN_COMMAND);
   boost::algorithm::split(tokens, trimmed, boost::algorithm::is_space(),
         boost::algorithm::token_compress_on);

   const std::string& head = tokens[0];
   if (head == "\\")
   {
      scanState_ = 'I';
      return g_Ack;
   }

   std::size_t digits = 0;
   while (digits < head.size() &&
         std::isdigit(static_cast<unsigned char>(head[digits])))
      ++digits;
   if (digits == 0)
      return Fault(ERR_INVALID_CARD_ADDRESS);
   int address;
   try
   {
      address = boost::lexical_cast<int>(head.substr(0, digits));
   }
   catch (const boost::bad_lexical_cast&)
   {
      return Fault(ERR_INVALID_CARD_ADDRESS);
   }
   const std::string mnemonic = boost::algorithm::to_upper_copy(
         head.substr(digits));

   std::map<std::string, std::string> params;
   for (std::size_t i = 1; i < tokens.size(); ++i)
   {
      const std::string& tok = tokens[i];
      if (boost::algorithm::ends_with(tok, "?") && tok.size() > 1)
      {
         params[tok.substr(0, tok.size() - 1)] = "?";
         continue;
      }
      const std::string::size_type eq = tok.find('=');
      if (eq == std::string::npos)
      {
         params[tok] = std::string(); // bare flag, e.g. "SS Z"
         continue;
      }
      if (eq == 0 || eq + 1 == tok.size())
         return Fault(ERR_MISSING_PARAMETERS);
      params[tok.substr(0, eq)] = tok.substr(eq + 1);
   }

   try
   {
      if (address == scannerCard_)
         return ExecuteScanner(mnemonic, params);
      if (address == logicCard_)
         return ExecuteLogic(mnemonic, params);
   }
   catch (const MissingValue&)
   {
      return Fault(ERR_MISSING_PARAMETERS);
   }
   catch (const boost::bad_lexical_cast&)
   {
      return Fault(ERR_PARAMETER_OUT_OF_RANGE);
   }
   return Fault(ERR_INVALID_CARD_ADDRESS);
}

// Caller holds mutex_
std::string DemoTigerConnector::ExecuteScanner(const std::string& mnemonic,
      const std::map<std::string, std::string>& params)
{
   auto isQuery = [&params](const std::string& key) {
      auto it = params.find(key);
      return it != params.end() && it->second == "?";
   };

   if (mnemonic == "LASER")
   {
      if (!HasParam(params, "X"))
         return Fault(ERR_MISSING_PARAMETERS);
      laserEnabled_ = IntegerParam(params, "X") != 0;
      return g_Ack;
   }
   if (mnemonic == "NR")
   {
      if (isQuery("X"))
         return std::string(g_Ack) + " X=" + std::to_string(slices_);
      if (HasParam(params, "X"))
      {
         const long slices = IntegerParam(params, "X");
         if (slices < 1)
            return Fault(ERR_PARAMETER_OUT_OF_RANGE);
         slices_ = slices;
      }
      if (HasParam(params, "Y"))
      {
         const long sides = IntegerParam(params, "Y");
         if (sides < 1 || sides > 2)
            return Fault(ERR_PARAMETER_OUT_OF_RANGE);
         sides_ = sides;
      }
      if (HasParam(params, "F"))
      {
         const long repeats = IntegerParam(params, "F");
         if (repeats < 1)
            return Fault(ERR_PARAMETER_OUT_OF_RANGE);
         repeats_ = repeats;
      }
      return g_Ack;
   }
   if (mnemonic == "RT")
   {
      if (HasParam(params, "F"))
         delayBeforeRepeatMs_ = NumericParam(params, "F");
      return g_Ack;
   }
   if (mnemonic == "NV")
   {
      if (HasParam(params, "X"))
         scanDurationMs_ = NumericParam(params, "X");
      if (HasParam(params, "Y"))
         delayBeforeSideMs_ = NumericParam(params, "Y");
      return g_Ack;
   }
   if (mnemonic == "SAA")
   {
      if (!HasParam(params, "Y"))
         return Fault(ERR_MISSING_PARAMETERS);
      const double amplitude = NumericParam(params, "Y");
      if (amplitude < 0.0)
         return Fault(ERR_PARAMETER_OUT_OF_RANGE);
      amplitudeDeg_ = amplitude;
      return g_Ack;
   }
   if (mnemonic == "SN")
   {
      if (isQuery("X"))
         return std::string(g_Ack) + " X=" + scanState_;
      if (!params.empty())
         return Fault(ERR_MISSING_PARAMETERS);
      if (slices_ < 1)
         return Fault(ERR_OPERATION_FAILED);
      return g_Ack;
   }
   if (mnemonic == "SS")
      return g_Ack;
   return Fault(ERR_UNKNOWN_COMMAND);
}

// Caller holds mutex_
std::string DemoTigerConnector::ExecuteLogic(const std::string& mnemonic,
      const std::map<std::string, std::string>& params)
{
   if (mnemonic == "M")
   {
      if (!HasParam(params, "E"))
         return Fault(ERR_MISSING_PARAMETERS);
      const long index = IntegerParam(params, "E");
      if (index < 0)
         return Fault(ERR_PARAMETER_OUT_OF_RANGE);
      pointer_ = static_cast<int>(index);
      return g_Ack;
   }
   if (mnemonic == "CCA")
   {
      if (params.empty())
         return Fault(ERR_MISSING_PARAMETERS);
      if (HasParam(params, "X"))
         presets_.push_back(static_cast<int>(IntegerParam(params, "X")));
      if (HasParam(params, "Y"))
         cells_[pointer_].type = static_cast<int>(IntegerParam(params, "Y"));
      if (HasParam(params, "Z"))
      {
         const long config = IntegerParam(params, "Z");
         if (config < 0 || config > 65535)
            return Fault(ERR_PARAMETER_OUT_OF_RANGE);
         cells_[pointer_].config = static_cast<int>(config);
      }
      return g_Ack;
   }
   if (mnemonic == "CCB")
   {
      if (params.empty())
         return Fault(ERR_MISSING_PARAMETERS);
      Cell& cell = cells_[pointer_];
      if (HasParam(params, "X"))
         cell.input1 = static_cast<int>(IntegerParam(params, "X"));
      if (HasParam(params, "Y"))
         cell.input2 = static_cast<int>(IntegerParam(params, "Y"));
      if (HasParam(params, "Z"))
         cell.input3 = static_cast<int>(IntegerParam(params, "Z"));
      return g_Ack;
   }
   if (mnemonic == "SS")
   {
      if (!HasParam(params, "Z"))
         return Fault(ERR_MISSING_PARAMETERS);
      ++saveCount_;
      return g_Ack;
   }
   return Fault(ERR_UNKNOWN_COMMAND);
}

void DemoTigerConnector::StartScan()
{
   std::vector<std::shared_ptr<DemoCamera>> cameras;
   long numSlices;
   double slicePeriodMs;
   {
      std::lock_guard<std::mutex> lock(mutex_);
      scanState_ = 'R';
      cameras = cameras_;
      numSlices = slices_ * sides_ * repeats_;
      slicePeriodMs = scanDurationMs_;
   }

   LOG_DEBUG(logger_) << "Scanning " << numSlices << " slice(s) for " <<
      cameras.size() << " camera device(s)";
   for (const auto& camera : cameras)
      camera->TriggerVolume(numSlices, slicePeriodMs);

   // The simulated scan is over by the time the start command is answered
   std::lock_guard<std::mutex> lock(mutex_);
   scanState_ = 'I';
}
