/***********************************************************************************************************************
*                                                                                                                      *
* libferrohal                                                                                                          *
*                                                                                                                      *
* Copyright (c) 2012-2024 Andrew D. Zonenberg and contributors                                                         *
* All rights reserved.                                                                                                 *
*                                                                                                                      *
* Redistribution and use in source and binary forms, with or without modification, are permitted provided that the     *
* following conditions are met:                                                                                        *
*                                                                                                                      *
*    * Redistributions of source code must retain the above copyright notice, this list of conditions, and the         *
*      following disclaimer.                                                                                           *
*                                                                                                                      *
*    * Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the       *
*      following disclaimer in the documentation and/or other materials provided with the distribution.                *
*                                                                                                                      *
*    * Neither the name of the author nor the names of any contributors may be used to endorse or promote products     *
*      derived from this software without specific prior written permission.                                           *
*                                                                                                                      *
* THIS SOFTWARE IS PROVIDED BY THE AUTHORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED   *
* TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL *
* THE AUTHORS BE HELD LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES        *
* (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR       *
* BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT *
* (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE       *
* POSSIBILITY OF SUCH DAMAGE.                                                                                          *
*                                                                                                                      *
***********************************************************************************************************************/

/**
	@file
	@author Mike Walters
	@brief Implementation of SCPILinuxGPIBTransport
 */

#include "ferrohal.h"

#ifdef HAS_LINUXGPIB

#include <gpib/ib.h>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

/**
	@brief Opens the device

	A device that cannot be opened is logged and leaves the transport disconnected.

	@throws ConfigurationError if the address cannot be parsed
 */
SCPILinuxGPIBTransport::SCPILinuxGPIBTransport(const string& args)
	: m_args(Trim(args))
	, m_handle(-1)
	, m_board(0)
	, m_pad(0)
	, m_sad(0)
{
	ParseAddress(m_args, m_board, m_pad, m_sad);

	LogDebug("Opening GPIB%d primary address %d, secondary %d\n", m_board, m_pad, m_sad);

	//Assert EOI on the last byte written, no EOS character
	m_handle = ibdev(m_board, m_pad, m_sad, T10s, 1, 0);
	if(m_handle < 0)
	{
		LogError("Couldn't open GPIB device %s (iberr = %d)\n", m_args.c_str(), iberr);
		return;
	}
	ibclr(m_handle);
}

SCPILinuxGPIBTransport::~SCPILinuxGPIBTransport()
{
	if(IsConnected())
		ibonl(m_handle, 0);
}

/**
	@brief Accepts "board:pad[:sad]" and "GPIB<board>::<pad>[::<sad>][::INSTR]"
 */
void SCPILinuxGPIBTransport::ParseAddress(const string& args, int& board, int& pad, int& sad)
{
	int n;
	if(args.compare(0, 4, "GPIB") == 0)
		n = sscanf(args.c_str(), "GPIB%d::%d::%d", &board, &pad, &sad);
	else
		n = sscanf(args.c_str(), "%d:%d:%d", &board, &pad, &sad);

	if(n < 2)
		throw ConfigurationError("GPIB address \"" + args + "\" needs at least a board and primary address");
	if( (board < 0) || (pad < 0) || (pad > 30) )
		throw ConfigurationError("GPIB address \"" + args + "\" is out of range");
}

string SCPILinuxGPIBTransport::GetTransportName()
{
	return "gpib";
}

string SCPILinuxGPIBTransport::GetConnectionString()
{
	return m_args;
}

bool SCPILinuxGPIBTransport::IsConnected()
{
	return (m_handle >= 0);
}

/**
	@brief Rounds up to the nearest timeout step linux-gpib supports
 */
void SCPILinuxGPIBTransport::SetTimeout(chrono::milliseconds timeout)
{
	static const struct
	{
		int64_t ms;
		int code;
	} steps[] =
	{
		{1, T1ms}, {3, T3ms}, {10, T10ms}, {30, T30ms}, {100, T100ms}, {300, T300ms},
		{1000, T1s}, {3000, T3s}, {10000, T10s}, {30000, T30s}, {100000, T100s}, {300000, T300s}
	};

	int code = T1000s;
	for(auto& s : steps)
	{
		if(timeout.count() <= s.ms)
		{
			code = s.code;
			break;
		}
	}

	if(IsConnected() && (ibtmo(m_handle, code) & ERR))
		LogWarning("Couldn't set timeout on GPIB device %s (iberr = %d)\n", m_args.c_str(), iberr);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Data transfer

bool SCPILinuxGPIBTransport::SendCommand(const string& cmd)
{
	if(!IsConnected())
		return false;

	LogTrace("[%s] -> %s\n", m_args.c_str(), cmd.c_str());
	string line = cmd + "\n";
	ibwrt(m_handle, line.c_str(), line.length());
	return !(ibsta & ERR) && (ibcnt == static_cast<int>(line.length()));
}

/**
	@brief Reads until the terminator, across as many ibrd() calls as it takes

	@throws TransportFailureError on a read error or timeout
 */
string SCPILinuxGPIBTransport::ReadReply(bool endOnSemicolon)
{
	if(!IsConnected())
		throw TransportFailureError("GPIB device " + m_args + " is not open");

	string ret;
	char buf[1024];
	while(true)
	{
		ibrd(m_handle, buf, sizeof(buf));
		if(ibsta & ERR)
			throw TransportFailureError("GPIB read from " + m_args + " failed (iberr = " + to_string(iberr) + ")");
		ret.append(buf, ibcnt);

		if(!ret.empty() && ( (ret.back() == '\n') || (endOnSemicolon && (ret.back() == ';')) ))
		{
			ret.pop_back();
			break;
		}

		//EOI without a newline also ends the message
		if(ibsta & END)
			break;
	}

	LogTrace("[%s] <- %s\n", m_args.c_str(), ret.c_str());
	return ret;
}

void SCPILinuxGPIBTransport::SendRawData(size_t len, const unsigned char* buf)
{
	if(!IsConnected())
		throw TransportFailureError("GPIB device " + m_args + " is not open");

	ibwrt(m_handle, reinterpret_cast<const char*>(buf), len);
	if( (ibsta & ERR) || (ibcnt != static_cast<int>(len)) )
		throw TransportFailureError("Short GPIB write to " + m_args);
}

/**
	@brief Reads exactly len bytes unless the device stops sending first
 */
size_t SCPILinuxGPIBTransport::ReadRawData(size_t len, unsigned char* buf)
{
	if(!IsConnected())
		return 0;

	size_t done = 0;
	while(done < len)
	{
		ibrd(m_handle, buf + done, len - done);
		if( (ibsta & ERR) || (ibcnt <= 0) )
			break;
		done += ibcnt;
	}
	return done;
}

void SCPILinuxGPIBTransport::FlushRXBuffer(void)
{
	if(IsConnected())
		ibclr(m_handle);
}

#endif
