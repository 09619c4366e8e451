#include <stdio.h>
#include <fstream>

#include "define.h"
#include "Logger.h"
#include "DataLoader.h"
#include "PacketMonitor.h"

static void print_help(const char* prog)
{
	std::cout
		<< "SYN flood admission guard\n"
		<< "Usage: " << prog << " [options]\n"
		<< "Options:\n"
		<< "  -c <file>     Config file (default: config.json when present)\n"
		<< "  -m <mode>     Backend: pcap | netfilter | xdp | iptables\n"
		<< "  -i <iface>    Network interface\n"
		<< "  -d <seconds>  Stop after this many seconds (default: run until Ctrl+C)\n"
		<< "  -h            Display this help and exit\n"
		<< std::endl;
}

int main(int argc, char* argv[])
{
	std::string config_path, mode_text, iface;
	long duration_sec = 0;
	bool config_given = false;

	for (int i = 1; i < argc; ++i)
	{
		std::string arg = argv[i];
		if (arg == "-c" && i + 1 < argc)
		{
			config_path = argv[++i];
			config_given = true;
		}
		else if (arg == "-m" && i + 1 < argc)
		{
			mode_text = argv[++i];
		}
		else if (arg == "-i" && i + 1 < argc)
		{
			iface = argv[++i];
		}
		else if (arg == "-d" && i + 1 < argc)
		{
			char* end = nullptr;
			duration_sec = strtol(argv[++i], &end, 10);
			if (*end != '\0' || duration_sec < 0)
			{
				std::cerr << "Invalid duration: " << argv[i] << "\n";
				return 1;
			}
		}
		else if (arg == "-h")
		{
			print_help(argv[0]);
			return 0;
		}
		else
		{
			std::cerr << "Unknown option: " << arg << "\n";
			print_help(argv[0]);
			return 1;
		}
	}

	// console logging while the config is read, reconfigured below
	InitLogger(LOG_INFO);

	NetworkConfig config;
	if (!config_given && std::ifstream("config.json").good())
	{
		config_path = "config.json";
		config_given = true;
	}
	if (config_given && !DataLoader::Load(config_path, config))
	{
		LogMsg(LOG_ERROR, "Can not load config: %s", config_path.c_str());
		return 1;
	}

	// command line wins over the file
	if (!mode_text.empty() && !ModeFromString(mode_text, config.mode))
	{
		LogMsg(LOG_ERROR, "Unknown mode: %s", mode_text.c_str());
		print_help(argv[0]);
		return 1;
	}
	if (!iface.empty())
		config.device_name = iface;

	if (!InitLogger(config.log_level, config.log_file))
	{
		std::cerr << "Failed to open log file: " << config.log_file << "\n";
		return 1;
	}

	int rc = 0;
	{
		PacketMonitor monitor(config);
		if (!monitor.Initialize() || !monitor.Run(std::chrono::seconds(duration_sec)))
			rc = 1;
	}

	ShutdownLogger();
	return rc;
}
