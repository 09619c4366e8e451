#pragma once
// map slots shared by syn_filter.bpf.c and BpfLoader

// stats_map
#define STAT_SYN_TOTAL 0
#define STAT_SYN_DROPPED 1
#define STAT_OTHER_DROPPED 2
#define STAT_MAX 3

// config_map, 0 means "use the built-in default"
#define CFG_THRESHOLD 0
#define CFG_WINDOW_NS 1
#define CFG_PERSISTENT 2
#define CFG_ALL_TRAFFIC 3
#define CFG_BLOCK_TTL_NS 4
#define CFG_MAX 5
