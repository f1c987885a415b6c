// include/common/configs.hpp

#pragma once

#include <chrono>  // For std::chrono durations
#include <cstddef> // For std::size_t
#include <cstdint> // For uint16_t etc.

/**
 * @file configs.hpp
 * @brief Central configuration file for constants used by fieldsync.
 *
 * Components copy these values into their Settings structs, so every constant
 * below is only a default and can be overridden per instance.
 */

// --- Socket Buffer Sizes ---
// Discovery beacons are tiny, data datagrams may use the full UDP payload.
constexpr size_t DISCOVERY_SOCK_BUF_SIZE =
    1024; ///< Receive buffer size for discovery sockets.
constexpr size_t DATA_SOCK_BUF_SIZE =
    65535; ///< Receive buffer size for telemetry/overlay sockets.

// --- Multicast Groups and Ports ---
constexpr const char *DISCOVERY_GROUP_V4 =
    "239.1.1.1"; ///< Beacon group for IPv4 interfaces.
constexpr const char *DISCOVERY_GROUP_V6 =
    "ff15:0:0:45:5246:6f72:6365:1"; ///< Beacon group for IPv6 interfaces.
constexpr const char *PER_INTERFACE_DISCOVERY_GROUP_V6 =
    "ff15::45:5246:6f72:6365"; ///< Beacon group of the per-interface variant.
constexpr const char *STREAM_GROUP_V6 =
    "ff15::45:5246:6f72:6365"; ///< Default SSM group for per-host data.
constexpr uint16_t DISCOVERY_PORT = 11000; ///< Beacon port.
constexpr uint16_t DATA_PORT = 11001;      ///< SSM telemetry port.
constexpr uint16_t VIS_AD_PORT = 11002; ///< SSM visualization advert port.

// --- Host Discovery ---
constexpr std::chrono::milliseconds DISCOVERY_COLLECTION_WINDOW{
    3000}; ///< Length of one beacon collection window. Interfaces are
           ///< re-enumerated at the start of every window.
constexpr std::chrono::milliseconds HOST_EXPIRY{
    3000}; ///< Dual-stack discovery forgets hosts silent for this long.

// --- Jitter Buffer ---
constexpr std::chrono::milliseconds RETENTION_WINDOW{
    1000}; ///< Packets older than this (local time) are purged.
constexpr std::chrono::milliseconds HEALTH_TRACKING_PERIOD{
    10000}; ///< Interval between two clock offset adaptations.
constexpr std::chrono::milliseconds HEALTH_WARMUP_PERIOD{
    1000}; ///< First adaptation happens this long after the first packet.
constexpr std::chrono::milliseconds TARGET_BUFFER_TIME{
    10}; ///< Safety margin the offset adaptation aims for.

// --- Field Sessions ---
constexpr std::chrono::milliseconds WS_INACTIVITY_TIMEOUT{
    1500}; ///< Hosts ping at least once a second, silence beyond this ends
           ///< the session.
constexpr std::chrono::milliseconds SSM_JOIN_RETRY_INTERVAL{
    3000}; ///< Delay before a failed source-specific join is retried.
constexpr std::chrono::milliseconds RECEIVE_RETRY_DELAY{
    1000}; ///< Delay before a socket restarts receiving after an error.
constexpr std::chrono::milliseconds CHANNEL_FULL_WARN_COOLDOWN{
    5000}; ///< Minimum time between two "channel full" warnings of a task.

// --- Channel Capacities ---
constexpr size_t HOST_LIST_CHANNEL_CAPACITY = 5;
constexpr size_t PACKET_CHANNEL_CAPACITY = 100;
constexpr size_t REQUEST_CHANNEL_CAPACITY = 10;
