#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Common flags
  static std::string log_file;
  static std::string server;
  static int32_t port;

  // Server-only flags
  static std::string listen_address;

  // Pipeline flags
  static std::string staging_directory;
  static bool keep_artifacts;
  static int32_t artifact_ttl;
  static int32_t max_code_length;
  static int32_t max_running;
  static int32_t max_waiting;

  // Sandbox flags
  static std::string runtime;
  static std::string image;
  static std::string interpreter;
  static std::string extension;
  static std::string mount_point;
  static std::string name_prefix;
  static int32_t memory_mb;
  static int32_t max_procs;
  static std::string cpus;
  static int32_t timeout_millis;
  static int32_t remove_timeout_millis;
  static int32_t max_output_kb;
};

#endif
