#pragma once
#include "define.h"
#include "PcapManager.h"
#include "SharedContext.h"

struct nfq_q_handle;
struct nfgenmsg;
struct nfq_data;

// Feeds packets from a backend into the AdmissionEngine.
//   pcap      : passive tap, verdicts are counted but nothing is dropped
//   netfilter : NFQUEUE, one thread per queue, verdicts are enforced
class PacketCapture
{
public:
	PacketCapture(SharedContext &, int mode);
	~PacketCapture();

	bool Start();
	void Stop();

	void packet_capture(const struct pcap_pkthdr *header, const u_char *pkt_data);
	static void packet_handler(u_char *param, const struct pcap_pkthdr *header, const u_char *pkt_data);

	static int nfq_callback(struct nfq_q_handle *qh, struct nfgenmsg *nfmsg,
							struct nfq_data *nfa, void *data);

	// "iptables ... -j NFQUEUE" rule steering the monitored traffic into the queues
	static std::string NfqueueRuleSpec(int queue_base, int num_queues, uint16_t port);


private:
	bool _StartPcap();
	void _RunPcap();
	bool _StartNetfilter();
	void _RunNetfilter(int queue_num);
	bool _SetupIptables();
	void _CleanupIptables();

	SharedContext &ctx;
	int m_mode;
	std::string m_device_name;

	PcapManager m_pcap;
	bool m_iptables_set{false};
	std::atomic<int> m_queues_ready{0};
	std::atomic<int> m_queues_failed{0};
	std::vector<thread> ThreadPool;
};
