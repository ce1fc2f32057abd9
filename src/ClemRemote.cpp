/*
 * Copyright 2017, Andrej Kislovskij
 *
 * This is PUBLIC DOMAIN software so use at your own risk as it comes
 * with no warranties. This code is yours to share, use and modify without
 * any restrictions or obligations.
 *
 * For more information see conwrap/LICENSE or refer refer to http://unlicense.org
 *
 * Author: gimesketvirtadieni at gmail dot com (Andrej Kislovskij)
 */

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cxxopts.hpp>
#include <exception>
#include <functional>
#include <g3log/logworker.hpp>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "clem/Client.hpp"
#include "clem/conn/tcp/Connection.hpp"
#include "clem/Exception.hpp"
#include "clem/log/ConsoleSink.hpp"
#include "clem/log/log.hpp"
#include "clem/Parameters.hpp"
#include "clem/PlayerState.hpp"
#include "clem/proto/Message.hpp"


using namespace clem;
using namespace clem::log;

using Client         = clem::Client<conn::tcp::Connection>;
using CommandHandler = std::function<bool(Client&, const std::vector<std::string>&)>;


static std::atomic<bool> running{true};


void signalHandler(int sig)
{
	running = false;
}


void printVersionInfo()
{
	std::cout << "ClemRemote version " << VERSION << std::endl;
}


void printLicenseInfo()
{
	printVersionInfo();

	std::cout << std::endl;
	std::cout << "Copyright 2017, Andrej Kislovskij" << std::endl;
	std::cout << std::endl;
	std::cout << "This is PUBLIC DOMAIN software so use at your own risk as it comes" << std::endl;
	std::cout << "with no warranties. This code is yours to share, use and modify without" << std::endl;
	std::cout << "any restrictions or obligations." << std::endl;
	std::cout << std::endl;
	std::cout << "For more information see conwrap/LICENSE or refer refer to http://unlicense.org" << std::endl;
	std::cout << std::endl;
	std::cout << "Author: gimesketvirtadieni at gmail dot com (Andrej Kislovskij)" << std::endl;
	std::cout << std::endl;
	std::cout << "ClemRemote relies a lot on numerous libraries, which where tailored as required:" << std::endl;
	std::cout << "-> Concurrent Wrapper for asynchronous tasks (Public Domain)" << std::endl;
	std::cout << "-> Logging library 'g3log' (Public Domain)" << std::endl;
	std::cout << "-> Standalone version of 'asio' for networking (Boost Software License)" << std::endl;
	std::cout << "-> Command line options parser 'cxxopts' (MIT)" << std::endl;
	std::cout << "-> Type safe utilities library 'type_safe' (MIT)" << std::endl;
	std::cout << "-> Scope guard library (Public Domain)" << std::endl;
	std::cout << "-> Serialization library 'protobuf' (BSD-3-Clause)" << std::endl;
	std::cout << "-> Unit testing library 'googletest' (BSD-3-Clause)" << std::endl;
	std::cout << std::endl;
	std::cout << "Important note: used dependencies may rely on other dependencies shipped with correspondent license." << std::endl;
	std::cout << std::endl;
}


void printCommandsInfo()
{
	std::cout << "Commands:" << std::endl;
	std::cout << "  status                          Show player status" << std::endl;
	std::cout << "  listen                          Listen and show messages (stop with CTRL-C)" << std::endl;
	std::cout << "  play                            Play" << std::endl;
	std::cout << "  stop                            Stop" << std::endl;
	std::cout << "  pause                           Pause" << std::endl;
	std::cout << "  playpause                       Play / Pause" << std::endl;
	std::cout << "  next                            Next track" << std::endl;
	std::cout << "  previous                        Previous track" << std::endl;
	std::cout << "  set_volume <volume>             Set player volume (0-100)" << std::endl;
	std::cout << "  playlist_open <playlist>        Open playlist" << std::endl;
	std::cout << "  change_song <playlist> <index>  Play song in playlist" << std::endl;
}


auto getArgument(const std::vector<std::string>& arguments, std::size_t index, const std::string& name)
{
	if (arguments.size() <= index)
	{
		throw cxxopts::OptionException("Command '" + arguments[0] + "' requires <" + name + "> argument");
	}

	auto result{0};
	try
	{
		result = std::stoi(arguments[index]);
	}
	catch (const std::exception&)
	{
		throw cxxopts::OptionException("Invalid <" + name + "> argument: " + arguments[index]);
	}

	return result;
}


bool printStatus(Client& client)
{
	auto statePtr{client.snapshot()};

	std::cout << *statePtr << std::endl;
	std::cout << "Playlists:" << std::endl;
	for (auto& playlist : statePtr->playlists)
	{
		std::cout << playlist << std::endl;
	}

	return true;
}


bool listen(Client& client)
{
	client.setMessageCallback([](const proto::Message& message)
	{
		std::cout << message << std::endl;
	});

	// waiting for Control^C or for the connection to be lost for good
	while (running && (client.isConnected() || client.getParameters().isReconnect()))
	{
		std::this_thread::sleep_for(std::chrono::milliseconds{200});
	}

	client.setMessageCallback(nullptr);
	if (!running)
	{
		std::cout << std::endl << "Interrupted by user." << std::endl;
	}

	return true;
}


auto createCommandHandlers()
{
	return std::map<std::string, CommandHandler>
	{
		{"status",        [](auto& client, auto&) {return printStatus(client);}},
		{"listen",        [](auto& client, auto&) {return listen(client);}},
		{"play",          [](auto& client, auto&) {return client.play();}},
		{"stop",          [](auto& client, auto&) {return client.stopPlayback();}},
		{"pause",         [](auto& client, auto&) {return client.pause();}},
		{"playpause",     [](auto& client, auto&) {return client.playPause();}},
		{"next",          [](auto& client, auto&) {return client.next();}},
		{"previous",      [](auto& client, auto&) {return client.previous();}},
		{"set_volume",    [](auto& client, auto& arguments)
		{
			return client.setVolume(getArgument(arguments, 1, "volume"));
		}},
		{"playlist_open", [](auto& client, auto& arguments)
		{
			return client.openPlaylist(getArgument(arguments, 1, "playlist"));
		}},
		{"change_song",   [](auto& client, auto& arguments)
		{
			return client.changeSong(getArgument(arguments, 1, "playlist"), getArgument(arguments, 2, "index"));
		}},
	};
}


int main(int argc, char *argv[])
{
	auto returnCode{1};

	// initializing log; sink is added once verbosity is known
	auto logWorkerPtr = g3::LogWorker::createLogWorker();
	g3::initializeLogging(logWorkerPtr.get());
	g3::only_change_at_initialization::addLogLevel(ERROR);

	try
	{
		// defining supported options
		cxxopts::Options options("clemremote", "ClemRemote - A client for Clementine music player remote control protocol\n");
		options
			.custom_help("[options]")
			.positional_help("<command> [arguments]")
			.add_options()
				("a,auth", "Auth code (if needed)", cxxopts::value<int>(), "<code>")
				("c,connect", "Connect timeout in seconds", cxxopts::value<int>()->default_value("5"), "<seconds>")
				("command", "Command with its arguments", cxxopts::value<std::vector<std::string>>())
				("D,debug", "Print debug log messages", cxxopts::value<bool>())
				("d,delay", "Delay between reconnect attempts in seconds", cxxopts::value<int>()->default_value("15"), "<seconds>")
				("h,help", "Print this help message", cxxopts::value<bool>())
				("l,license", "Print license details", cxxopts::value<bool>())
				("p,port", "Player remote control port", cxxopts::value<unsigned int>()->default_value("5500"), "<port>")
				("r,reconnect", "Try to reconnect", cxxopts::value<bool>())
				("s,host", "Player remote control hostname", cxxopts::value<std::string>()->default_value("localhost"), "<host>")
				("t,timeout", "Authentication timeout in seconds", cxxopts::value<int>()->default_value("5"), "<seconds>")
				("v,version", "Print version details", cxxopts::value<bool>())
				("w,wait", "Time to wait for initial player data in seconds", cxxopts::value<int>()->default_value("3"), "<seconds>");
		options.parse_positional({"command"});

		// parsing provided options
		auto result = options.parse(argc, argv);

		logWorkerPtr->addSink(std::make_unique<ConsoleSink>(result.count("debug") ? nullptr : SinkFilter::belowLevel(INFO)), &ConsoleSink::print);

		if (result.count("help"))
		{
			std::cout << options.help() << std::endl;
			printCommandsInfo();
			returnCode = 0;
		}
		else if (result.count("license"))
		{
			printLicenseInfo();
			returnCode = 0;
		}
		else if (result.count("version"))
		{
			printVersionInfo();
			returnCode = 0;
		}
		else if (!result.count("command"))
		{
			std::cout << options.help() << std::endl;
			printCommandsInfo();
		}
		else
		{
			auto arguments{result["command"].as<std::vector<std::string>>()};
			auto name{arguments[0]};
			std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c)
			{
				return std::tolower(c);
			});

			// unknown command is reported before connecting to the player
			auto handlers{createCommandHandlers()};
			auto found{handlers.find(name)};
			if (found == handlers.end())
			{
				throw cxxopts::OptionException("Unknown command: " + name);
			}

			Parameters parameters{result["host"].as<std::string>(), result["port"].as<unsigned int>(), ts::nullopt, result.count("reconnect") > 0};
			if (result.count("auth"))
			{
				parameters.setAuthCode(result["auth"].as<int>());
			}
			parameters.setReconnectDelay(std::chrono::seconds{result["delay"].as<int>()});
			parameters.setAuthTimeout(std::chrono::seconds{result["timeout"].as<int>()});
			parameters.setConnectTimeout(std::chrono::seconds{result["connect"].as<int>()});

			// throws if parameters are not valid
			Client client{parameters};

			// registering signal handler
			signal(SIGHUP, signalHandler);
			signal(SIGTERM, signalHandler);
			signal(SIGINT, signalHandler);

			client.start();

			// player sends its whole state right after connecting
			auto deadline{std::chrono::steady_clock::now() + std::chrono::seconds{result["wait"].as<int>()}};
			while (running && !client.isFirstSnapshotReceived() && std::chrono::steady_clock::now() < deadline)
			{
				std::this_thread::sleep_for(std::chrono::milliseconds{250});
			}

			if (found->second(client, arguments))
			{
				returnCode = 0;
			}
			else
			{
				std::cout << "Command '" << name << "' was not sent: " << client.getLastError() << std::endl;
			}

			client.stop();
		}
	}
	catch (const cxxopts::OptionException& e)
	{
		std::cout << "Wrong option(s) provided: " << e.what() << std::endl;
	}
	catch (const Exception& error)
	{
		LOG(ERROR) << error;
	}
	catch (const std::exception& error)
	{
		LOG(ERROR) << error.what();
	}

	return returnCode;
}
