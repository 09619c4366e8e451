#include "HeaderView.h"
#include <cstring>

ParseStatus HeaderView::Parse(const u_char *frame, size_t len, HeaderView &out)
{
    if (frame == nullptr || len < sizeof(EtherHeader))
        return ParseStatus::MALFORMED;

    EtherHeader ether;
    memcpy(&ether, frame, sizeof(EtherHeader));

    out.ethertype = ntohs(ether.type);
    if (out.ethertype != ETHERTYPE_IPV4)
        return ParseStatus::NOT_APPLICABLE;

    return ParseIp(frame + sizeof(EtherHeader), len - sizeof(EtherHeader), out);
}

ParseStatus HeaderView::ParseIp(const u_char *packet, size_t len, HeaderView &out)
{
    if (packet == nullptr || len < sizeof(IpHeader))
        return ParseStatus::MALFORMED;

    // packed structs are copied out instead of cast, the buffer has no alignment guarantee
    IpHeader ip;
    memcpy(&ip, packet, sizeof(IpHeader));

    out.ethertype = ETHERTYPE_IPV4;
    out.ipVersion = (ip.verIhl >> 4) & 0x0F;
    out.ipHeaderLen = (ip.verIhl & 0x0F) * 4;
    out.protocol = ip.protocol;
    memcpy(&out.srcIp, ip.srcIp, 4);
    memcpy(&out.dstIp, ip.dstIp, 4);

    if (out.ipVersion != 4)
        return ParseStatus::NOT_APPLICABLE;

    // IHL below 5 can not hold the fixed part of the header
    if (out.ipHeaderLen < sizeof(IpHeader) || len < out.ipHeaderLen)
        return ParseStatus::MALFORMED;

    if (out.protocol != IPPROTO_TCP_NUM)
        return ParseStatus::NOT_APPLICABLE;

    // a non-first fragment carries payload where the TCP header would be
    if (ntohs(ip.fragOffset) & IP_FRAG_OFFSET_MASK)
        return ParseStatus::NOT_APPLICABLE;

    if (len < (size_t)out.ipHeaderLen + sizeof(TcpHeader))
        return ParseStatus::MALFORMED;

    TcpHeader tcp;
    memcpy(&tcp, packet + out.ipHeaderLen, sizeof(TcpHeader));

    out.srcPort = ntohs(tcp.srcPort);
    out.dstPort = ntohs(tcp.dstPort);
    out.tcpFlags = tcp.flags;

    return ParseStatus::OK;
}

const char* ParseStatusToString(ParseStatus status)
{
    switch (status)
    {
    case ParseStatus::OK:
        return "ok";
    case ParseStatus::MALFORMED:
        return "malformed";
    case ParseStatus::NOT_APPLICABLE:
        return "not_applicable";
    }
    return "unknown";
}
