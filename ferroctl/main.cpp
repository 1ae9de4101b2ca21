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
	@brief Program entry point
 */

#include "../ferrohal/ferrohal.h"

using namespace std;

static SCPITransport* CreateTransport(const YAML::Node& node, const string& what);
static FunctionGenerator* CreateGenerator(const YAML::Node& node);
static Oscilloscope* CreateScope(const YAML::Node& node);
static void RunExperiment(const YAML::Node& config, const string& output);

void ShowUsage()
{
	fprintf(stderr,
		"Usage: ferroctl --config <file.yaml> [--output <file.csv>] [logger options]\n"
		"\n"
		"    --config <file>    Instrument, session and experiment description\n"
		"    --output <file>    Where to write the captured trace (overrides session.output)\n"
		"    --help             Print this message\n"
		"\n"
		"    --quiet|-q         Reduce logging level by one step\n"
		"    --verbose          Set logging level to verbose\n"
		"    --debug            Set logging level to debug\n"
		"    --trace <class>    Print trace messages for the given class\n");
}

int main(int argc, char* argv[])
{
	Severity console_verbosity = Severity::NOTICE;

	//Parse command-line arguments
	string configPath;
	string output;
	for(int i=1; i<argc; i++)
	{
		string s(argv[i]);

		//Let the logger eat its args first
		if(ParseLoggerArguments(i, argc, argv, console_verbosity))
			continue;

		if(s == "--help")
		{
			ShowUsage();
			return 0;
		}
		else if( (s == "--config") && (i+1 < argc) )
			configPath = argv[++i];
		else if( (s == "--output") && (i+1 < argc) )
			output = argv[++i];
		else
		{
			fprintf(stderr, "Unrecognized command-line argument \"%s\", use --help\n", s.c_str());
			return 1;
		}
	}

	//Set up logging
	g_log_sinks.emplace(g_log_sinks.begin(), new ColoredSTDLogSink(console_verbosity));

	if(configPath.empty())
	{
		ShowUsage();
		return 1;
	}

	TransportStaticInit();
	DriverStaticInit();

	try
	{
		RunExperiment(YAML::LoadFile(configPath), output);
	}
	catch(const FerrohalError& e)
	{
		LogError("%s\n", e.what());
		return 1;
	}
	catch(const YAML::Exception& e)
	{
		LogError("Failed to load %s: %s\n", configPath.c_str(), e.what());
		return 1;
	}

	return 0;
}

/**
	@brief Connects to both instruments, captures one trace and saves it
 */
static void RunExperiment(const YAML::Node& config, const string& output)
{
	SessionConfig session;
	session.LoadConfiguration(config["session"]);
	if(!output.empty())
		session.m_outputPath = output;

	unique_ptr<MeasurementWaveform> waveform(MeasurementWaveform::CreateFromConfig(config["experiment"]));
	unique_ptr<FunctionGenerator> gen(CreateGenerator(config["generator"]));
	unique_ptr<Oscilloscope> scope(CreateScope(config["oscilloscope"]));

	for(Instrument* inst : initializer_list<Instrument*>{gen.get(), scope.get()})
	{
		LogNotice("%s %s (serial %s, firmware %s) on %s %s\n",
			inst->GetVendor().c_str(),
			inst->GetName().c_str(),
			inst->GetSerial().c_str(),
			inst->GetFirmwareVersion().c_str(),
			inst->GetTransportName().c_str(),
			inst->GetTransportConnectionString().c_str());
	}

	AcquisitionSession acq(*gen, *scope, session);
	acq.signal_stepStarted().connect([](AcquisitionSession::Step step)
		{ LogDebug("[%d/7] %s\n", (int)step + 1, AcquisitionSession::GetNameOfStep(step).c_str()); });

	auto result = acq.Run(*waveform);
	CSVTraceWriter::Write(session.m_outputPath, result.trace);

	LogNotice("Saved %zu samples of %s data to %s\n",
		result.trace.size(), result.metadata.typeTag.c_str(), session.m_outputPath.c_str());
}

/**
	@brief Creates the transport described by the transport, args and timeout_ms keys of an instrument node
 */
static SCPITransport* CreateTransport(const YAML::Node& node, const string& what)
{
	if(!node || !node.IsMap())
		throw ConfigurationError("No " + what + " section in configuration");

	string transport = "lan";
	string args;
	LoadConfigValue(node, "transport", transport);
	LoadConfigValue(node, "args", args);
	if(args.empty())
		throw ConfigurationError("No connection arguments for " + what);

	int64_t timeout = 0;
	LoadConfigValue(node, "timeout_ms", timeout);
	if(node["timeout_ms"] && (timeout <= 0))
		throw ConfigurationError("timeout_ms for " + what + " must be positive");

	auto ret = SCPITransport::CreateTransport(transport, args);
	if(ret == nullptr)
		throw ConfigurationError("Unknown transport \"" + transport + "\" for " + what);
	if(!ret->IsConnected())
	{
		delete ret;
		throw TransportFailureError("Could not connect to " + what + " at " + args);
	}

	if(timeout > 0)
		ret->SetTimeout(chrono::milliseconds(timeout));
	return ret;
}

static FunctionGenerator* CreateGenerator(const YAML::Node& node)
{
	string driver = "keysight_81150a";
	if(node && node.IsMap())
		LoadConfigValue(node, "driver", driver);

	//The driver owns the transport once it is constructed
	unique_ptr<SCPITransport> transport(CreateTransport(node, "generator"));
	auto ret = FunctionGenerator::CreateFunctionGenerator(driver, transport.get(), node["model"]);
	if(ret == nullptr)
		throw ConfigurationError("Unknown function generator driver \"" + driver + "\"");
	transport.release();
	return ret;
}

static Oscilloscope* CreateScope(const YAML::Node& node)
{
	string driver = "keysight_dsox3024a";
	if(node && node.IsMap())
		LoadConfigValue(node, "driver", driver);

	//The driver owns the transport once it is constructed
	unique_ptr<SCPITransport> transport(CreateTransport(node, "oscilloscope"));
	auto ret = Oscilloscope::CreateOscilloscope(driver, transport.get(), node["model"]);
	if(ret == nullptr)
		throw ConfigurationError("Unknown oscilloscope driver \"" + driver + "\"");
	transport.release();
	return ret;
}
