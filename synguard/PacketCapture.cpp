#include "PacketCapture.h"
#include "Logger.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sys/socket.h>
#include <linux/netfilter.h>
#include <libnetfilter_queue/libnetfilter_queue.h>

PacketCapture::PacketCapture(SharedContext &context, int mode) : ctx(context), m_mode(mode)
{
}

PacketCapture::~PacketCapture()
{
	Stop();
}

bool PacketCapture::Start()
{
	if (!ctx.engine)
	{
		LogMsg(LOG_ERROR, "[Capture] no admission engine for mode %s", ModeToString(ctx.config.mode));
		return false;
	}

	if (m_mode == MODE_PCAP)
		return _StartPcap();
	if (m_mode == MODE_NETFILTER)
		return _StartNetfilter();

	LogMsg(LOG_ERROR, "[Capture] mode %s has no userspace capture", ModeToString((eMode)m_mode));
	return false;
}

void PacketCapture::Stop()
{
	ctx.running = false;

	if (m_pcap.GetHandle())
		pcap_breakloop(m_pcap.GetHandle());

	for (auto &t : ThreadPool)
	{
		if (t.joinable())
			t.join();
	}
	ThreadPool.clear();

	_CleanupIptables();
	m_pcap.Close();
}

// ---------------------------------------------------------------- pcap

bool PacketCapture::_StartPcap()
{
	m_device_name = ctx.config.device_name;
	if (!m_pcap.Open(m_device_name, ctx.config.server_port))
		return false;

	LogMsg(LOG_INFO, "[Capture] pcap on %s is passive: verdicts are counted, not enforced", m_device_name.c_str());
	ThreadPool.push_back(thread(&PacketCapture::_RunPcap, this));
	return true;
}

void PacketCapture::_RunPcap()
{
	int rc = pcap_loop(m_pcap.GetHandle(), -1, packet_handler, (u_char *)this);
	if (rc == PCAP_ERROR)
		LogMsg(LOG_ERROR, "[Capture] pcap_loop: %s", pcap_geterr(m_pcap.GetHandle()));
}

void PacketCapture::packet_capture(const pcap_pkthdr *header, const u_char *pkt_data)
{
	if (!ctx.running)
	{
		pcap_breakloop(m_pcap.GetHandle());
		return;
	}

	// caplen, not len: only the captured bytes are there to read
	ctx.engine->ClassifyFrame(pkt_data, header->caplen, MonotonicNowNs());
}

void PacketCapture::packet_handler(u_char *user, const pcap_pkthdr *header, const u_char *pkt_data)
{
	PacketCapture *self = reinterpret_cast<PacketCapture *>(user);
	self->packet_capture(header, pkt_data);
}

// ---------------------------------------------------------------- netfilter

bool PacketCapture::_StartNetfilter()
{
	const int num_queues = ctx.config.num_queues;

	for (int i = 0; i < num_queues; i++)
	{
		ThreadPool.push_back(thread(&PacketCapture::_RunNetfilter, this, ctx.config.queue_base + i));
	}

	// every queue bound before traffic is steered into it
	while (m_queues_ready + m_queues_failed < num_queues)
		std::this_thread::sleep_for(std::chrono::milliseconds(10));

	if (m_queues_failed > 0)
	{
		LogMsg(LOG_ERROR, "[Capture] %d of %d NFQUEUE queues could not be bound", m_queues_failed.load(), num_queues);
		Stop();
		return false;
	}

	if (!_SetupIptables())
	{
		Stop();
		return false;
	}
	return true;
}

int PacketCapture::nfq_callback(nfq_q_handle *qh, nfgenmsg *nfmsg, nfq_data *nfa, void *data)
{
	(void)nfmsg;
	PacketCapture *self = reinterpret_cast<PacketCapture *>(data);

	// packet id is needed for the verdict
	uint32_t id = 0;
	struct nfqnl_msg_packet_hdr *ph = nfq_get_msg_packet_hdr(nfa);
	if (ph)
		id = ntohl(ph->packet_id);

	// payload starts at the IP header
	unsigned char *pkt_data = nullptr;
	int len = nfq_get_payload(nfa, &pkt_data);
	if (len < 0 || pkt_data == nullptr)
		return nfq_set_verdict(qh, id, NF_ACCEPT, 0, NULL);

	Decision decision = self->ctx.engine->ClassifyIpPacket(pkt_data, (size_t)len, MonotonicNowNs());

	if (decision.verdict == Verdict::DROP)
		return nfq_set_verdict(qh, id, NF_DROP, 0, NULL);

	return nfq_set_verdict(qh, id, NF_ACCEPT, 0, NULL);
}

void PacketCapture::_RunNetfilter(int queue_num)
{
	struct nfq_handle *h;
	struct nfq_q_handle *qh;
	int fd;
	int rv;
	char buf[4096] __attribute__((aligned));

	// 1. open the NFQUEUE handle
	h = nfq_open();
	if (!h)
	{
		LogMsg(LOG_ERROR, "[Capture] error during nfq_open() for queue %d", queue_num);
		m_queues_failed++;
		return;
	}

	// 2. rebind AF_INET (unbind fails harmlessly on newer kernels)
	if (nfq_unbind_pf(h, AF_INET) < 0)
	{
		LogMsg(LOG_DEBUG, "[Capture] nfq_unbind_pf() failed, continuing");
	}
	if (nfq_bind_pf(h, AF_INET) < 0)
	{
		LogMsg(LOG_ERROR, "[Capture] error during nfq_bind_pf()");
		nfq_close(h);
		m_queues_failed++;
		return;
	}

	// 3. create the queue, nfq_callback is static so 'this' goes along as data
	qh = nfq_create_queue(h, queue_num, &nfq_callback, (void *)this);
	if (!qh)
	{
		LogMsg(LOG_ERROR, "[Capture] error during nfq_create_queue(%d)", queue_num);
		nfq_close(h);
		m_queues_failed++;
		return;
	}

	// 4. headers are enough for a verdict
	if (nfq_set_mode(qh, NFQNL_COPY_PACKET, 128) < 0)
	{
		LogMsg(LOG_ERROR, "[Capture] can't set packet_copy mode on queue %d", queue_num);
		nfq_destroy_queue(qh);
		nfq_close(h);
		m_queues_failed++;
		return;
	}

	// 5. receive loop, the timeout lets the thread see a stop request
	fd = nfq_fd(h);
	struct timeval tv;
	tv.tv_sec = 0;
	tv.tv_usec = 200 * 1000;
	setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

	LogMsg(LOG_INFO, "[Capture] NFQUEUE %d bound", queue_num);
	m_queues_ready++;

	while (ctx.running)
	{
		rv = recv(fd, buf, sizeof(buf), 0);
		if (rv >= 0)
		{
			// calls nfq_callback for every message in the buffer
			nfq_handle_packet(h, buf, rv);
			continue;
		}
		if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
			continue;
		if (errno == ENOBUFS)
		{
			// kernel dropped queued packets, the verdict path is not keeping up
			LogMsg(LOG_WARN, "[Capture] queue %d overrun (ENOBUFS)", queue_num);
			continue;
		}
		LogMsg(LOG_ERROR, "[Capture] recv on queue %d: %s", queue_num, strerror(errno));
		break;
	}

	nfq_destroy_queue(qh);
	nfq_close(h);
}

std::string PacketCapture::NfqueueRuleSpec(int queue_base, int num_queues, uint16_t port)
{
	std::string rule = "INPUT -p tcp";
	if (port != 0)
		rule += " --dport " + std::to_string(port);

	if (num_queues > 1)
		rule += " -j NFQUEUE --queue-balance " + std::to_string(queue_base) + ":" +
				std::to_string(queue_base + num_queues - 1);
	else
		rule += " -j NFQUEUE --queue-num " + std::to_string(queue_base);

	// no listener -> accept instead of drop
	rule += " --queue-bypass";
	return rule;
}

bool PacketCapture::_SetupIptables()
{
	std::string cmd = "iptables -I " + NfqueueRuleSpec(ctx.config.queue_base, ctx.config.num_queues, ctx.config.server_port);

	LogMsg(LOG_INFO, "[System] Setting up iptables: %s", cmd.c_str());
	if (system(cmd.c_str()) != 0)
	{
		LogMsg(LOG_ERROR, "[System] Failed to set iptables rule. Check root privileges.");
		return false;
	}
	m_iptables_set = true;
	return true;
}

void PacketCapture::_CleanupIptables()
{
	if (!m_iptables_set)
		return;

	// only our rule, the rest of INPUT stays as it was
	std::string cmd = "iptables -D " + NfqueueRuleSpec(ctx.config.queue_base, ctx.config.num_queues, ctx.config.server_port);
	LogMsg(LOG_INFO, "[System] Cleaning up iptables rules...");
	if (system(cmd.c_str()) != 0)
		LogMsg(LOG_WARN, "[System] could not remove: %s", cmd.c_str());
	m_iptables_set = false;
}
