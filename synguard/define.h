#pragma once
#include <thread>
#include <vector>
#include <map>
#include <unordered_map>
#include <string>
#include <chrono>
#include <mutex>
#include <list>
#include <memory>
#include <cstdint>
#include <cstddef>
#include <time.h>
#include <iostream>
#include <sys/types.h>
#include <arpa/inet.h>         // ntohs, inet_ntop
#include <net/if.h>            // if_nametoindex

#include <atomic>
#include <condition_variable>

using namespace std;

// flow table is split into shards, a source always lands in the same shard
const int NUM_FLOW_SHARDS = 8;

// default admission limits: more than 10 pure SYN inside one 2 second bucket
const uint64_t DEFAULT_SYN_THRESHOLD = 10;
const uint64_t DEFAULT_SYN_WINDOW_NS = 2000000000ULL;
const size_t DEFAULT_TABLE_CAPACITY = 16384;

// config upper bounds, ms values stay far from overflow once scaled to ns
const uint64_t MAX_SYN_THRESHOLD = 0xFFFFFFFFULL;
const uint64_t MAX_SYN_WINDOW_MS = 86400000ULL;       // 1 day
const uint64_t MAX_BLOCK_TTL_MS = 30 * 86400000ULL;   // 30 days
const size_t MAX_TABLE_CAPACITY = 1 << 24;
const uint64_t MAX_SAMPLER_INTERVAL_MS = 3600000ULL;

// IPv4 fragOffset field, the low 13 bits are the offset in 8 byte units
const unsigned short IP_FRAG_OFFSET_MASK = 0x1FFF;

const unsigned short ETHERTYPE_IPV4 = 0x0800;
const unsigned char IPPROTO_TCP_NUM = 6;

enum eMode
{
	MODE_PCAP,
	MODE_NETFILTER,
	MODE_XDP,
	MODE_IPTABLES
};

enum eTcpFlag : unsigned char
{
	FLAG_FIN = 0x01,
	FLAG_SYN = 0x02,
	FLAG_RST = 0x04,
	FLAG_PSH = 0x08,
	FLAG_ACK = 0x10,
	FLAG_URG = 0x20
};

// mapped 1:1 onto NF_ACCEPT / NF_DROP and XDP_PASS / XDP_DROP by the backends
enum class Verdict : uint8_t
{
	PASS = 0,
	DROP = 1
};

#pragma pack(push, 1)
typedef struct EtherHeader {
	unsigned char dstMac[6];
	unsigned char srcMac[6];
	unsigned short type;
} EtherHeader;

typedef struct IpHeader {
	unsigned char verIhl;
	unsigned char tos;
	unsigned short length;
	unsigned short id;
	unsigned short fragOffset;
	unsigned char ttl;
	unsigned char protocol;
	unsigned short checksum;
	unsigned char srcIp[4];
	unsigned char dstIp[4];
} IpHeader;

typedef struct TcpHeader {
	unsigned short srcPort;
	unsigned short dstPort;
	unsigned int seq;
	unsigned int ack;
	unsigned char data;
	unsigned char flags;
	unsigned short windowSize;
	unsigned short checksum;
	unsigned short urgent;
} TcpHeader;
#pragma pack(pop)

static_assert(sizeof(EtherHeader) == 14, "ethernet header must be 14 bytes");
static_assert(sizeof(IpHeader) == 20, "minimal ipv4 header must be 20 bytes");
static_assert(sizeof(TcpHeader) == 20, "minimal tcp header must be 20 bytes");

const char* ModeToString(eMode mode);
bool ModeFromString(const std::string& text, eMode& out_mode);
