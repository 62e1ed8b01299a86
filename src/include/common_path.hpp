#pragma once

// Common path
#define ROOT									"/var/lib/lanwatch/"


// Sqlite DB
#define DB_PATH									ROOT "db/"
#define DB										"lanwatch.db"


// Kernel ARP table
#define ARP_TABLE_PATH							"/proc/net/arp"


// Log file (mirrored when --log-file is not given)
#define LOG_DIR									"/var/log/lanwatch"
#define LOG_FILE								LOG_DIR "/lanwatch.log"


// Subscriber server
#define LISTEN_ADDRESS							"0.0.0.0"
#define LISTEN_PORT								8000


// Scan cadence
#define SCAN_INTERVAL_SEC						30
#define GRACE_SCANS								3
