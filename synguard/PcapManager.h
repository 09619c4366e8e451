#pragma once
#include "define.h"
#include <pcap.h>

// Owns the live capture handle of the pcap backend. Also used by the other
// backends to resolve an interface name when none is configured.
class PcapManager
{

public:
	PcapManager();
	~PcapManager();
	PcapManager(const PcapManager &) = delete;
	PcapManager &operator=(const PcapManager &) = delete;

	// lists the devices and asks for one on stdin, name copied to out_name
	static bool SelectDevice(std::string &out_name);

	bool Open(const std::string &device_name, uint16_t server_port);
	void Close();

	pcap_t *GetHandle()
	{
		return adhandle;
	}

private:
	bool _SetFilter(uint16_t server_port);

	pcap_t *adhandle{};
};
