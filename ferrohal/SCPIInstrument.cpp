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
	@brief Implementation of SCPIInstrument
 */

#include "ferrohal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

SCPIInstrument::SCPIInstrument(SCPITransport* transport, const ParameterTable& limits, bool identify)
	: m_transport(transport)
	, m_limits(limits)
{
	if(m_transport == nullptr)
		throw TransportFailureError("Cannot create an instrument without a transport");

	if(identify)
		Identify();
}

SCPIInstrument::~SCPIInstrument()
{
	delete m_transport;
}

/**
	@brief Reads *IDN? and splits it into vendor, model, serial number and firmware version
 */
void SCPIInstrument::Identify()
{
	auto reply = Trim(Query("*IDN?"));
	auto fields = split_fields(reply, ',');
	if(fields.size() != 4)
	{
		LogWarning("Bad IDN response \"%s\"\n", reply.c_str());
		m_model = reply;
		return;
	}

	m_vendor = Trim(fields[0]);
	m_model = Trim(fields[1]);
	m_serial = Trim(fields[2]);
	m_fwVersion = Trim(fields[3]);

	LogDebug("Connected to %s %s (serial %s, firmware %s)\n",
		m_vendor.c_str(), m_model.c_str(), m_serial.c_str(), m_fwVersion.c_str());
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Accessors

string SCPIInstrument::GetTransportName()
{
	return m_transport->GetName();
}

string SCPIInstrument::GetTransportConnectionString()
{
	return m_transport->GetConnectionString();
}

string SCPIInstrument::GetName() const
{
	return m_model;
}

string SCPIInstrument::GetVendor() const
{
	return m_vendor;
}

string SCPIInstrument::GetSerial() const
{
	return m_serial;
}

string SCPIInstrument::GetFirmwareVersion() const
{
	return m_fwVersion;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Common commands

void SCPIInstrument::Reset()
{
	SendCommand("*RST");
}

void SCPIInstrument::Initialize()
{
	SendCommand("*RST");
	SendCommand("*CLS");
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Helpers

void SCPIInstrument::SendCommand(const string& cmd)
{
	m_transport->SendCommandImmediate(cmd);
}

string SCPIInstrument::Query(const string& cmd)
{
	return m_transport->SendCommandImmediateWithReply(cmd);
}
