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
	@brief Implementation of SCPITransport
 */

#include "ferrohal.h"

#include <ctype.h>

using namespace std;

SCPITransport::CreateMapType SCPITransport::m_createprocs;

SCPITransport::SCPITransport()
{
}

SCPITransport::~SCPITransport()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Enumeration

void SCPITransport::DoAddTransportClass(string name, CreateProcType proc)
{
	m_createprocs[name] = proc;
}

void SCPITransport::EnumTransports(vector<string>& names)
{
	for(CreateMapType::iterator it=m_createprocs.begin(); it != m_createprocs.end(); ++it)
		names.push_back(it->first);
}

SCPITransport* SCPITransport::CreateTransport(const string& transport, const string& args)
{
	if(m_createprocs.find(transport) != m_createprocs.end())
		return m_createprocs[transport](args);

	LogError("Invalid transport name \"%s\"\n", transport.c_str());
	return NULL;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Blocking command API

/**
	@brief Sends a command which does not require a response.
 */
void SCPITransport::SendCommandImmediate(const string& cmd)
{
	lock_guard<recursive_mutex> lock(m_netMutex);

	if(!SendCommand(cmd))
		throw TransportFailureError("Failed to send \"" + cmd + "\" to " + GetConnectionString());
}

/**
	@brief Sends a command, then returns the response.

	This is an atomic operation requiring no mutexing at the caller side.
 */
string SCPITransport::SendCommandImmediateWithReply(const string& cmd, bool endOnSemicolon)
{
	lock_guard<recursive_mutex> lock(m_netMutex);

	SendCommandImmediate(cmd);
	return ReadReply(endOnSemicolon);
}

/**
	@brief Sends a command which reads an IEEE 488.2 definite length binary block response

	The terminating newline after the block is consumed as well.
 */
vector<uint8_t> SCPITransport::SendCommandImmediateWithRawBlockReply(const string& cmd)
{
	lock_guard<recursive_mutex> lock(m_netMutex);

	SendCommandImmediate(cmd);
	auto buf = ReadRawBlock();

	//Discard trailing newline
	unsigned char tmp;
	if(1 != ReadRawData(1, &tmp))
		LogWarning("No terminator after %zu byte block\n", buf.size());

	return buf;
}

/**
	@brief Reads the "#<n><length><data>" framing of a binary block
 */
vector<uint8_t> SCPITransport::ReadRawBlock()
{
	//Read the length
	char tmplen[3] = {0};
	if(2 != ReadRawData(2, (unsigned char*)tmplen))			//expect #n
		throw TransportFailureError("Timed out waiting for block header");
	if( (tmplen[0] != '#') || !isdigit(static_cast<unsigned char>(tmplen[1])) )
		throw TransportFailureError(string("Bad block header \"") + tmplen + "\"");
	size_t ndigits = tmplen[1] - '0';
	if(ndigits == 0)
		throw TransportFailureError("Indefinite length blocks are not supported");

	//Read the digits
	char digits[10] = {0};
	if(ndigits != ReadRawData(ndigits, (unsigned char*)digits))
		throw TransportFailureError("Timed out reading block length");
	for(size_t i=0; i<ndigits; i++)
	{
		if(!isdigit(static_cast<unsigned char>(digits[i])))
			throw TransportFailureError(string("Bad block length \"") + digits + "\"");
	}
	char* end = nullptr;
	size_t len = strtoull(digits, &end, 10);
	if( (*end != '\0') || (len > MAX_BLOCK_LENGTH) )
		throw TransportFailureError(string("Unreasonable block length \"") + digits + "\"");

	LogTrace("Expecting %zu bytes of block data\n", len);

	//Read the actual data
	vector<uint8_t> buf(len);
	if(len && (len != ReadRawData(len, &buf[0])))
		throw TransportFailureError("Short read on " + to_string(len) + " byte block");
	return buf;
}

/**
	@brief Sends a command whose reply is a comma separated list of floating point values

	Some instruments wrap the list in a definite length block header, which is stripped.
 */
vector<double> SCPITransport::SendCommandImmediateWithAsciiValuesReply(const string& cmd)
{
	string reply = Trim(SendCommandImmediateWithReply(cmd, false));

	if(!reply.empty() && (reply[0] == '#'))
	{
		size_t ndigits = 0;
		if(reply.length() >= 2)
			ndigits = reply[1] - '0';
		if( (ndigits < 1) || (ndigits > 9) || (reply.length() < 2 + ndigits) )
			throw TransportFailureError("Bad block header in ASCII reply to \"" + cmd + "\"");
		reply = reply.substr(2 + ndigits);
	}

	vector<double> ret;
	for(auto& tok : explode(reply, ','))
	{
		auto field = Trim(tok);
		if(field.empty())
			continue;

		char* end = nullptr;
		double d = strtod(field.c_str(), &end);
		if(*end != '\0')
			throw TransportFailureError("Malformed value \"" + field + "\" in reply to \"" + cmd + "\"");
		ret.push_back(d);
	}

	LogTrace("Got %zu ASCII values\n", ret.size());
	return ret;
}

/**
	@brief Sends a command followed by a definite length binary block argument
 */
void SCPITransport::SendCommandWithBinaryBlock(const string& cmd, const vector<uint8_t>& data)
{
	lock_guard<recursive_mutex> lock(m_netMutex);

	if(!IsConnected())
		throw TransportFailureError("Not connected to " + GetConnectionString());

	auto len = to_string(data.size());
	string header = cmd + " #" + to_string(len.length()) + len;

	LogTrace("Sending %s (%zu bytes)\n", header.c_str(), data.size());

	vector<uint8_t> buf(header.begin(), header.end());
	buf.insert(buf.end(), data.begin(), data.end());
	buf.push_back('\n');
	SendRawData(buf.size(), &buf[0]);
}

void SCPITransport::FlushRXBuffer(void)
{
	LogError("SCPITransport::FlushRXBuffer is unimplemented\n");
}

/**
	@brief Sets how long a single read or write may block before it counts as a transport failure
 */
void SCPITransport::SetTimeout(chrono::milliseconds /*timeout*/)
{
	LogWarning("%s transport has a fixed timeout\n", GetName().c_str());
}
