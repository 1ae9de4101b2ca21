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
	@brief Helper functions and static initialization for the library
 */

#include "ferrohal.h"

#include <ctype.h>

using namespace std;

/**
	@brief Static initialization for SCPI transports
 */
void TransportStaticInit()
{
	AddTransportClass(SCPISocketTransport);

#ifdef HAS_LINUXGPIB
	AddTransportClass(SCPILinuxGPIBTransport);
#endif
}

/**
	@brief Static initialization for instrument drivers
 */
void DriverStaticInit()
{
	AddDriverClass(KeysightDSOX3024AOscilloscope);

	AddFunctionGeneratorDriverClass(Keysight81150AFunctionGenerator);
}

/**
	@brief Removes whitespace (including CR/LF left over from instrument replies) from both ends of a string
 */
string Trim(const string& str)
{
	size_t first = 0;
	while( (first < str.length()) && isspace(static_cast<unsigned char>(str[first])) )
		first++;

	size_t last = str.length();
	while( (last > first) && isspace(static_cast<unsigned char>(str[last-1])) )
		last--;

	return str.substr(first, last - first);
}

/**
	@brief Like std::to_string, but output in scientific notation
 */
string to_string_sci(double d)
{
	char tmp[32];
	snprintf(tmp, sizeof(tmp), "%e", d);
	return tmp;
}

/**
	@brief Splits a string up into an array separated by delimiters

	Empty fields are dropped.
 */
vector<string> explode(const string& str, char separator)
{
	vector<string> ret;
	string tmp;
	for(auto c : str)
	{
		if(c == separator)
		{
			if(!tmp.empty())
				ret.push_back(tmp);
			tmp = "";
		}
		else
			tmp += c;
	}
	if(!tmp.empty())
		ret.push_back(tmp);
	return ret;
}

/**
	@brief Splits a string up into an array separated by delimiters, keeping empty fields

	Used for fixed-layout replies where an empty field is a protocol error rather than padding.
 */
vector<string> split_fields(const string& str, char separator)
{
	vector<string> ret;
	string tmp;
	for(auto c : str)
	{
		if(c == separator)
		{
			ret.push_back(tmp);
			tmp = "";
		}
		else
			tmp += c;
	}
	ret.push_back(tmp);
	return ret;
}

/**
	@brief Converts a string to lower case
 */
string strtolower(const string& s)
{
	string ret;
	for(auto c : s)
		ret += tolower(static_cast<unsigned char>(c));
	return ret;
}
