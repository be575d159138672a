///////////////////////////////////////////////////////////////////////////////
// FILE:          ErrorCodes.h
// PROJECT:       SPIMCore
// SUBSYSTEM:     SPIMCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Error codes carried by SPIMError.
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

#define SPIMERR_OK                            0
#define SPIMERR_GENERIC                       1 // unspecified error

// Controller replies
#define SPIMERR_PROTOCOL_MALFORMED           10
#define SPIMERR_PROTOCOL_DEVICE_ERROR        11
#define SPIMERR_INVALID_COMMAND              12

// Device session
#define SPIMERR_SESSION_BUSY                 20
#define SPIMERR_SESSION_TIMEOUT              21
#define SPIMERR_SESSION_NOT_CONNECTED        22
#define SPIMERR_SESSION_TRANSPORT            23

// Sequence programming
#define SPIMERR_PROGRAM_PARTIALLY_PROGRAMMED 30
#define SPIMERR_PROGRAM_REJECTED             31

// Acquisition runs
#define SPIMERR_INVALID_PLAN                 40
#define SPIMERR_RUN_ALREADY_ACTIVE           41
#define SPIMERR_CAMERA                       42
#define SPIMERR_CAMERA_BUFFER_OVERFLOW       43
#define SPIMERR_FRAME_TIMEOUT                44
#define SPIMERR_UNEXPECTED_FRAME             45
#define SPIMERR_START_SCAN_NOT_CONFIRMED     46
#define SPIMERR_SINK                         47

// Configuration and files
#define SPIMERR_INVALID_CONFIGURATION        50
#define SPIMERR_FILE_OPEN_FAILED             51
#define SPIMERR_FILE_WRITE_FAILED            52
