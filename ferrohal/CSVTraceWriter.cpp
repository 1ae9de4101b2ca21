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
	@brief Implementation of CSVTraceWriter
 */

#include "ferrohal.h"

#include <errno.h>
#include <string.h>

using namespace std;

/**
	@brief Writes one header row then one row per sample, replacing any existing file

	@throws ExportError if the file cannot be created or written
 */
void CSVTraceWriter::Write(const string& path, const Trace& trace)
{
	FILE* fp = fopen(path.c_str(), "w");
	if(!fp)
		throw ExportError("Failed to open \"" + path + "\" for writing: " + strerror(errno));

	fprintf(fp, "time (s),voltage (V)\n");

	auto& time = trace.GetTime();
	auto& voltage = trace.GetVoltage();
	for(size_t i=0; i<trace.size(); i++)
		fprintf(fp, "%.10e,%.10e\n", time[i], voltage[i]);

	bool failed = ferror(fp);
	if(0 != fclose(fp))
		failed = true;
	if(failed)
		throw ExportError("Failed to write \"" + path + "\"");

	LogVerbose("Wrote %zu samples to %s\n", trace.size(), path.c_str());
}
