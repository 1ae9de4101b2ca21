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
	@brief Declaration of SCPILinuxGPIBTransport
	@ingroup transports
 */

#ifndef SCPILinuxGPIBTransport_h
#define SCPILinuxGPIBTransport_h

#ifdef HAS_LINUXGPIB

/**
	@brief GPIB transport on top of the linux-gpib library

	Connection arguments are "board:pad[:sad]" or a VISA style resource name such as "GPIB0::10::INSTR".

	@ingroup transports
 */
class SCPILinuxGPIBTransport : public SCPITransport
{
public:
	SCPILinuxGPIBTransport(const std::string& args);
	virtual ~SCPILinuxGPIBTransport();

	static std::string GetTransportName();
	virtual std::string GetConnectionString() override;

	virtual bool SendCommand(const std::string& cmd) override;
	virtual std::string ReadReply(bool endOnSemicolon = true) override;
	virtual size_t ReadRawData(size_t len, unsigned char* buf) override;
	virtual void SendRawData(size_t len, const unsigned char* buf) override;
	virtual void FlushRXBuffer(void) override;
	virtual bool IsConnected() override;

	virtual void SetTimeout(std::chrono::milliseconds timeout) override;

	TRANSPORT_INITPROC(SCPILinuxGPIBTransport)

protected:
	static void ParseAddress(const std::string& args, int& board, int& pad, int& sad);

	std::string m_args;

	///@brief Device descriptor from ibdev(), negative if not open
	int m_handle;

	int m_board;
	int m_pad;
	int m_sad;
};

#endif

#endif
