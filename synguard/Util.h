#pragma once
#include "define.h"

// address in network byte order -> dotted quad
inline std::string IpToString(uint32_t ip_network_order)
{
    struct in_addr a;
    a.s_addr = ip_network_order;
    char buf[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &a, buf, INET_ADDRSTRLEN) == nullptr)
        return "<invalid-ip>";
    return std::string(buf);
}

// dotted quad -> network byte order, false on anything inet_pton rejects
inline bool IpFromString(const std::string &text, uint32_t &out_ip)
{
    struct in_addr a;
    if (inet_pton(AF_INET, text.c_str(), &a) != 1)
        return false;
    out_ip = a.s_addr;
    return true;
}
