#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Sandboxes
DECLARE_string(temp_directory);
DECLARE_int32(max_output_kb);

// Orchestrator
DECLARE_int32(timeout_seconds);
DECLARE_string(memory_limit);
DECLARE_double(cpu_share);
DECLARE_string(languages_file);

// Container backend
DECLARE_string(docker_binary);
DECLARE_int32(container_startup_grace_seconds);

// Remote backend
DECLARE_string(remote_api_base);
DECLARE_string(remote_api_key_env);
DECLARE_int32(remote_call_timeout_seconds);
DECLARE_bool(remote_ephemeral_workspaces);
DECLARE_string(curl_binary);

// Security gate
DECLARE_int32(max_source_length);

// Repair loop
DECLARE_int32(max_repair_attempts);
DECLARE_string(producer_command);
DECLARE_int32(producer_timeout_seconds);

#endif
