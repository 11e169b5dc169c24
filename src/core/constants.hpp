#pragma once

constexpr const char* DUMPFLEET_VERSION     = "0.4.0";

// ── Dump timeouts ───────────────────────────────────────────
constexpr int HEADLESS_DUMP_TIMEOUT_SECS    = 300;   // Unattended jobs fail fast
constexpr int INTERACTIVE_DUMP_TIMEOUT_SECS = 600;   // Leaves room for the cancel dialog
constexpr int CANCEL_GRACE_SECS             = 5;     // SIGTERM -> SIGKILL window on cancel
constexpr int EXTRACT_TICK_MS               = 1000;  // Headless elapsed-time notice
constexpr int JOB_POLL_MS                   = 100;   // DumpJob loop granularity
constexpr int COORDINATOR_WAIT_MS           = 100;   // Control loop wake-up interval

// ── Fleet defaults ──────────────────────────────────────────
constexpr int DEFAULT_MAX_CONCURRENCY       = 3;
constexpr const char* DEFAULT_PATH_STRATEGY = "unified";
constexpr const char* DEFAULT_ISSUE_PREFIX  = "issues";
constexpr const char* DEFAULT_LOG_DIRECTORY = "~/dumpfleet/logs";
constexpr const char* INDIVIDUAL_DUMP_DIR   = "dumps";
constexpr const char* MANIFEST_FILENAME     = "manifest.json";
constexpr const char* EXTRACTION_LOG_NAME   = "extraction.log";

// ── Device-side paths and commands ──────────────────────────
constexpr const char* DEVICE_SERIAL_ENV     = "ADB_SERIAL";
constexpr const char* COREDUMP_DIR          = "/data/var/lib/systemd/systemd-coredump/";
constexpr const char* COREDUMP_LIST_CMD     = "ls /data/var/lib/systemd/systemd-coredump/";
constexpr const char* DEVICE_CLEANUP_CMD    =
    "rm -rf /data/var/lib/systemd/systemd-coredump/* /data/tmp/crash-alarm/*";
constexpr int DEVICE_CMD_TIMEOUT_SECS       = 30;

// ── Crash monitor ───────────────────────────────────────────
constexpr int CRASH_MONITOR_INTERVAL_MS     = 5000;

// ── Artifact store (JFrog CLI) ──────────────────────────────
constexpr const char* DEFAULT_JFROG_URL     = "https://bart.sec.samsung.net/artifactory";
constexpr const char* DEFAULT_JFROG_REPO    = "oneos-qsymphony-issues-generic-local";
constexpr const char* DEFAULT_JFROG_SERVER  = "qsutils-server";
constexpr int UPLOAD_TIMEOUT_SECS           = 300;
constexpr int UPLOAD_VERIFY_TIMEOUT_SECS    = 30;
