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
	@brief Declaration of the exception types thrown by the library
 */

#ifndef FerrohalExceptions_h
#define FerrohalExceptions_h

/**
	@brief Base class for every error raised by the library

	Nothing inside the library catches these. The caller decides whether to abort the experiment or rerun the whole
	acquisition session.
 */
class FerrohalError : public std::runtime_error
{
public:
	explicit FerrohalError(const std::string& what)
		: std::runtime_error(what)
	{}
};

///@brief A waveform preamble did not parse into the fixed ten-field schema
class MalformedPreambleError : public FerrohalError
{
public:
	explicit MalformedPreambleError(const std::string& what)
		: FerrohalError(what)
	{}
};

///@brief The preamble named a sample format code the decoder cannot interpret
class UnsupportedSampleFormatError : public FerrohalError
{
public:
	UnsupportedSampleFormatError(int format)
		: FerrohalError("Unsupported waveform sample format " + std::to_string(format))
		, m_format(format)
	{}

	int GetFormat() const
	{ return m_format; }

protected:
	int m_format;
};

///@brief The raw sample buffer does not hold the number or kind of samples the preamble announced
class SampleCountMismatchError : public FerrohalError
{
public:
	explicit SampleCountMismatchError(const std::string& what)
		: FerrohalError(what)
	{}
};

///@brief Breakpoints handed to the synthesizer are malformed
class InvalidBreakpointsError : public FerrohalError
{
public:
	explicit InvalidBreakpointsError(const std::string& what)
		: FerrohalError(what)
	{}
};

///@brief All samples handed to the device code scaler are equal, so no range can be derived
class DegenerateRangeError : public FerrohalError
{
public:
	explicit DegenerateRangeError(const std::string& what)
		: FerrohalError(what)
	{}
};

///@brief A write or query did not complete on the underlying transport
class TransportFailureError : public FerrohalError
{
public:
	explicit TransportFailureError(const std::string& what)
		: FerrohalError(what)
	{}
};

///@brief A numeric configuration value is outside its declared range
class ParameterOutOfRangeError : public FerrohalError
{
public:
	ParameterOutOfRangeError(const std::string& name, const std::string& what)
		: FerrohalError(what)
		, m_name(name)
	{}

	const std::string& GetParameterName() const
	{ return m_name; }

protected:
	std::string m_name;
};

///@brief A configuration value is not a member of its declared set of allowed values
class ParameterNotInSetError : public FerrohalError
{
public:
	ParameterNotInSetError(const std::string& name, const std::string& what)
		: FerrohalError(what)
		, m_name(name)
	{}

	const std::string& GetParameterName() const
	{ return m_name; }

protected:
	std::string m_name;
};

///@brief An arbitrary waveform sequence was driven out of order
class SequenceStateError : public FerrohalError
{
public:
	explicit SequenceStateError(const std::string& what)
		: FerrohalError(what)
	{}
};

///@brief A configuration file or node is missing a required key or has the wrong type
class ConfigurationError : public FerrohalError
{
public:
	explicit ConfigurationError(const std::string& what)
		: FerrohalError(what)
	{}
};

///@brief A captured trace could not be written out
class ExportError : public FerrohalError
{
public:
	explicit ExportError(const std::string& what)
		: FerrohalError(what)
	{}
};

#endif
