#include "util/flags.hpp"

std::string Flags::log_file;
std::string Flags::server = "127.0.0.1";
int32_t Flags::port = 7070;

std::string Flags::listen_address = "0.0.0.0";

std::string Flags::staging_directory = "staging";
bool Flags::keep_artifacts = false;
int32_t Flags::artifact_ttl = 0;
int32_t Flags::max_code_length = 5000;
int32_t Flags::max_running = -1;
int32_t Flags::max_waiting = 64;

std::string Flags::runtime;
std::string Flags::image = "python:3.11-slim";
std::string Flags::interpreter = "python";
std::string Flags::extension = ".py";
std::string Flags::mount_point = "/scripts";
std::string Flags::name_prefix = "runbox-";
int32_t Flags::memory_mb = 128;
int32_t Flags::max_procs = 64;
std::string Flags::cpus = "1";
int32_t Flags::timeout_millis = 10000;
int32_t Flags::remove_timeout_millis = 5000;
int32_t Flags::max_output_kb = 1024;
