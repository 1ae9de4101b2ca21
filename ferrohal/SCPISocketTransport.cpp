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
	@author Andrew D. Zonenberg
	@brief Implementation of SCPISocketTransport
 */

#include "ferrohal.h"

#include <string.h>
#include <errno.h>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

/**
	@brief Connects to an instrument

	A failed connection is logged and leaves the transport disconnected, callers check IsConnected().

	@throws ConfigurationError if the address cannot be parsed
 */
SCPISocketTransport::SCPISocketTransport(const string& args)
	: m_socket(AF_INET, SOCK_STREAM, IPPROTO_TCP)
	, m_port(DEFAULT_PORT)
{
	ParseAddress(args, m_hostname, m_port);

	LogDebug("Connecting to %s:%u\n", m_hostname.c_str(), m_port);
	if(!m_socket.Connect(m_hostname, m_port))
	{
		LogError("Couldn't connect to %s:%u\n", m_hostname.c_str(), m_port);
		m_socket.Close();
		return;
	}

	//Binary block uploads are large, don't hold back the tail of a write
	if(!m_socket.DisableNagle())
	{
		LogError("Couldn't disable Nagle on connection to %s\n", m_hostname.c_str());
		m_socket.Close();
		return;
	}

	//Capture readout can take a while after a long stimulus
	SetTimeout(chrono::seconds(10));
}

SCPISocketTransport::~SCPISocketTransport()
{
}

/**
	@brief Splits "host[:port]"
 */
void SCPISocketTransport::ParseAddress(const string& args, string& hostname, unsigned short& port)
{
	auto address = Trim(args);
	auto colon = address.rfind(':');
	hostname = address.substr(0, colon);
	if(hostname.empty())
		throw ConfigurationError("No hostname in LAN address \"" + args + "\"");
	if(colon == string::npos)
		return;

	auto sport = address.substr(colon + 1);
	char* end = nullptr;
	unsigned long n = strtoul(sport.c_str(), &end, 10);
	if(sport.empty() || (*end != '\0') || (n < 1) || (n > 65535))
		throw ConfigurationError("Bad port \"" + sport + "\" in LAN address \"" + args + "\"");
	port = static_cast<unsigned short>(n);
}

string SCPISocketTransport::GetTransportName()
{
	return "lan";
}

string SCPISocketTransport::GetConnectionString()
{
	return m_hostname + ":" + to_string(m_port);
}

bool SCPISocketTransport::IsConnected()
{
	return m_socket.IsValid();
}

void SCPISocketTransport::SetTimeout(chrono::milliseconds timeout)
{
	unsigned int us = chrono::duration_cast<chrono::microseconds>(timeout).count();
	if(!m_socket.SetRxTimeout(us))
		LogWarning("Couldn't set receive timeout on %s: %s\n", m_hostname.c_str(), strerror(errno));
	if(!m_socket.SetTxTimeout(us))
		LogWarning("Couldn't set send timeout on %s: %s\n", m_hostname.c_str(), strerror(errno));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Data transfer

bool SCPISocketTransport::SendCommand(const string& cmd)
{
	if(!IsConnected())
		return false;

	LogTrace("[%s] -> %s\n", m_hostname.c_str(), cmd.c_str());
	string line = cmd + "\n";
	return m_socket.SendLooped(reinterpret_cast<const unsigned char*>(line.c_str()), line.length());
}

/**
	@brief Reads one reply, up to and not including its terminator

	@throws TransportFailureError if the instrument stops sending before the terminator
 */
string SCPISocketTransport::ReadReply(bool endOnSemicolon)
{
	string ret;
	unsigned char c;
	while(true)
	{
		if(!m_socket.RecvLooped(&c, 1))
		{
			throw TransportFailureError(
				"Timed out after " + to_string(ret.length()) + " bytes of reply from " + GetConnectionString());
		}

		if( (c == '\n') || (endOnSemicolon && (c == ';')) )
			break;
		ret += c;
	}

	LogTrace("[%s] <- %s\n", m_hostname.c_str(), ret.c_str());
	return ret;
}

void SCPISocketTransport::SendRawData(size_t len, const unsigned char* buf)
{
	if(!m_socket.SendLooped(buf, len))
		throw TransportFailureError("Failed to send " + to_string(len) + " bytes to " + GetConnectionString());
}

size_t SCPISocketTransport::ReadRawData(size_t len, unsigned char* buf)
{
	if(!m_socket.RecvLooped(buf, len))
	{
		LogTrace("[%s] timed out reading %zu bytes\n", m_hostname.c_str(), len);
		return 0;
	}
	return len;
}

void SCPISocketTransport::FlushRXBuffer(void)
{
	m_socket.FlushRxBuffer();
}
