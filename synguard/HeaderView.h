#pragma once
#include "define.h"

enum class ParseStatus
{
	OK,
	MALFORMED,      // too short for the headers it claims to carry
	NOT_APPLICABLE  // not TCP over IPv4, passed through untouched
};

// Read-only view over the Ethernet/IPv4/TCP headers of one frame.
// Values are copied out of the frame in host byte order except the
// addresses, which stay in network order (same as the kernel maps key them).
// The frame itself is never retained.
struct HeaderView
{
	unsigned short ethertype{};
	unsigned char ipVersion{};
	unsigned char ipHeaderLen{};  // bytes
	unsigned char protocol{};
	uint32_t srcIp{};
	uint32_t dstIp{};
	unsigned short srcPort{};
	unsigned short dstPort{};
	unsigned char tcpFlags{};

	bool IsSyn() const { return tcpFlags & FLAG_SYN; }
	bool IsAck() const { return tcpFlags & FLAG_ACK; }
	bool IsRst() const { return tcpFlags & FLAG_RST; }
	bool IsFin() const { return tcpFlags & FLAG_FIN; }

	// SYN=1 and ACK=0, the only packets the rate limiter looks at
	bool IsPureSyn() const { return IsSyn() && !IsAck(); }

	// Frame starts with an Ethernet header (pcap, XDP).
	static ParseStatus Parse(const u_char *frame, size_t len, HeaderView &out);

	// Frame starts with the IPv4 header (NFQUEUE payloads).
	static ParseStatus ParseIp(const u_char *packet, size_t len, HeaderView &out);
};

const char* ParseStatusToString(ParseStatus status);
