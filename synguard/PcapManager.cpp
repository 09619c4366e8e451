#include "PcapManager.h"
#include "Logger.h"

PcapManager::PcapManager()
{
}

PcapManager::~PcapManager()
{
    Close();
}

bool PcapManager::SelectDevice(std::string &out_name)
{
    char errbuf[PCAP_ERRBUF_SIZE];
    pcap_if_t *d{};
    pcap_if_t *alldevs{};
    int i = 0, inum = 0;

    /* Retrieve the device list */
    if (pcap_findalldevs(&alldevs, errbuf) == -1)
    {
        LogMsg(LOG_ERROR, "Error in pcap_findalldevs: %s", errbuf);
        return false;
    }

    /* Print the list */
    for (d = alldevs; d; d = d->next)
    {
        printf("%d. %s", ++i, d->name);
        if (d->description)
            printf(" (%s)\n", d->description);
        else
            printf(" (No description available)\n");
    }
    if (i == 0)
    {
        LogMsg(LOG_ERROR, "No interfaces found! Check capture privileges.");
        pcap_freealldevs(alldevs);
        return false;
    }

    printf("Enter the interface number (1-%d):", i);
    if (!(std::cin >> inum) || inum < 1 || inum > i)
    {
        LogMsg(LOG_ERROR, "Interface number out of range.");
        pcap_freealldevs(alldevs);
        return false;
    }

    /* Jump to the selected adapter */
    for (d = alldevs, i = 0; i < inum - 1; d = d->next, i++);

    out_name = d->name;
    pcap_freealldevs(alldevs);
    return true;
}

bool PcapManager::Open(const std::string &device_name, uint16_t server_port)
{
    char errbuf[PCAP_ERRBUF_SIZE];
    Close();

    /* 1. pcap_create instead of pcap_open_live so the buffer can be sized */
    if ((adhandle = pcap_create(device_name.c_str(), errbuf)) == NULL)
    {
        LogMsg(LOG_ERROR, "Unable to create the adapter handle. %s: %s", device_name.c_str(), errbuf);
        return false;
    }

    // 64MB, set before activation
    if (pcap_set_buffer_size(adhandle, 64 * 1024 * 1024) != 0)
    {
        LogMsg(LOG_WARN, "Failed to set buffer size.");
    }

    /* 2. headers are all the engine reads */
    pcap_set_snaplen(adhandle, 128);
    pcap_set_promisc(adhandle, 1);
    pcap_set_timeout(adhandle, 1);     // read timeout (1ms)
    pcap_set_immediate_mode(adhandle, 1);

    /* 3. activate */
    int activate_status = pcap_activate(adhandle);
    if (activate_status < 0)
    {
        LogMsg(LOG_ERROR, "Unable to activate the adapter. %s: %s", device_name.c_str(), pcap_geterr(adhandle));
        Close();
        return false;
    }
    else if (activate_status > 0)
    {
        LogMsg(LOG_WARN, "pcap_activate on %s: %s", device_name.c_str(), pcap_statustostr(activate_status));
    }

    if (pcap_datalink(adhandle) != DLT_EN10MB)
    {
        LogMsg(LOG_ERROR, "%s is not an ethernet device", device_name.c_str());
        Close();
        return false;
    }

    if (!_SetFilter(server_port))
    {
        Close();
        return false;
    }

    LogMsg(LOG_INFO, "listening on %s...", device_name.c_str());
    return true;
}

bool PcapManager::_SetFilter(uint16_t server_port)
{
    struct bpf_program fcode;
    std::string filter_exp = "tcp";
    if (server_port != 0)
        filter_exp += " dst port " + std::to_string(server_port);

    // 1. compile
    if (pcap_compile(adhandle, &fcode, filter_exp.c_str(), 1, PCAP_NETMASK_UNKNOWN) < 0)
    {
        LogMsg(LOG_ERROR, "Error compiling filter: %s", pcap_geterr(adhandle));
        return false;
    }

    // 2. apply, non-matching packets never reach the handler
    int rc = pcap_setfilter(adhandle, &fcode);
    pcap_freecode(&fcode);
    if (rc < 0)
    {
        LogMsg(LOG_ERROR, "Error setting the filter: %s", pcap_geterr(adhandle));
        return false;
    }

    LogMsg(LOG_INFO, "[Info] Kernel Filter Applied: %s", filter_exp.c_str());
    return true;
}

void PcapManager::Close()
{
    if (adhandle)
    {
        pcap_close(adhandle);
        adhandle = nullptr;
    }
}
