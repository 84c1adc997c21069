#include "util/flags.hpp"

DEFINE_string(temp_directory, "/tmp/codemend",
              "Where the private execution directories should be created");
DEFINE_int32(max_output_kb, 64 * 1024,
             "Maximum size of the stdout/stderr of a local execution");

DEFINE_int32(timeout_seconds, 30,
             "Default execution timeout, used when a request sets none");
DEFINE_string(memory_limit, "100m",
              "Default memory ceiling of an isolation unit");
DEFINE_double(cpu_share, 0,
              "Default CPU share of an isolation unit, 0 means unlimited");
DEFINE_string(languages_file, "",
              "Text-format LanguageTable replacing the built-in languages");

DEFINE_string(docker_binary, "docker", "Container runtime client");
DEFINE_int32(container_startup_grace_seconds, 10,
             "Extra wall time granted to a container for startup and cleanup");

DEFINE_string(remote_api_base, "https://api.daytona.dev",
              "Base URL of the remote sandbox API");
DEFINE_string(remote_api_key_env, "REMOTE_SANDBOX_API_KEY",
              "Environment variable holding the remote sandbox API key");
DEFINE_int32(remote_call_timeout_seconds, 120,
             "Protocol-level timeout of a single remote sandbox call");
DEFINE_bool(remote_ephemeral_workspaces, false,
            "Delete the remote workspace after every execution");
DEFINE_string(curl_binary, "curl", "HTTP client used by the remote backend");

DEFINE_int32(max_source_length, 10000,
             "Sources longer than this many characters are rejected");

DEFINE_int32(max_repair_attempts, 3,
             "Maximum number of repaired sources executed per repair cycle");
DEFINE_string(producer_command, "",
              "Command that writes repaired or generated code to stdout, given "
              "a JSON request on stdin");
DEFINE_int32(producer_timeout_seconds, 120,
             "Time allowed to the code producer for each request");
