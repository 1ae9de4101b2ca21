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
	@brief Declaration of MockTransport
 */

#ifndef MockTransport_h
#define MockTransport_h

#include "../ferrohal/ferrohal.h"

#include <sys/types.h>

/**
	@brief Transport that records everything sent to it and replays canned replies

	A reply registered for a command is queued every time that command is sent, so a reply to *IDN? only needs to
	be registered once.
 */
class MockTransport : public SCPITransport
{
public:
	MockTransport(const std::string& idn = "");
	virtual ~MockTransport();

	virtual std::string GetConnectionString() override;
	virtual std::string GetName() override;

	virtual bool SendCommand(const std::string& cmd) override;
	virtual std::string ReadReply(bool endOnSemicolon = true) override;
	virtual size_t ReadRawData(size_t len, unsigned char* buf) override;
	virtual void SendRawData(size_t len, const unsigned char* buf) override;
	virtual bool IsConnected() override;
	virtual void FlushRXBuffer() override;

	//Scripting
	void SetReply(const std::string& cmd, const std::string& reply);
	void SetRawReply(const std::string& cmd, const std::vector<uint8_t>& reply);
	void FailOn(const std::string& cmd);

	///@brief Also appends "<tag>: <command>" to a log shared with other transports, to check ordering across them
	void SetJournal(std::vector<std::string>* journal, const std::string& tag)
	{
		m_journal = journal;
		m_tag = tag;
	}

	//Inspection
	const std::vector<std::string>& GetCommands() const
	{ return m_commands; }

	const std::vector< std::vector<uint8_t> >& GetRawWrites() const
	{ return m_rawWrites; }

	void ClearCommands()
	{ m_commands.clear(); m_rawWrites.clear(); }

	bool HasCommand(const std::string& cmd) const;
	ssize_t IndexOf(const std::string& cmd) const;

	static std::vector<uint8_t> MakeBlock(const std::vector<uint8_t>& data);

protected:
	std::vector<std::string> m_commands;
	std::vector< std::vector<uint8_t> > m_rawWrites;

	std::map<std::string, std::vector<uint8_t> > m_replies;
	std::set<std::string> m_failures;

	std::deque<uint8_t> m_rxBuffer;

	std::vector<std::string>* m_journal;
	std::string m_tag;
};

#endif
