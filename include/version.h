// include/version.h
#pragma once

// Firmware identity (V1)
#define ESN_FIRMWARE_NAME "esn-lorawan-node"
#define ESN_FIRMWARE_VERSION "0.3.0-dev"

// Schema versions (V1)
#define ESN_CONFIG_SCHEMA_VERSION 1
#define ESN_LOG_SCHEMA_VERSION 1
#define ESN_SESSION_RECORD_VERSION 1
