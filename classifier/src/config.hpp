#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // Reference data
    std::string keywords_path;
    std::string sources_path;
    std::string known_actors_path;

    // Cache
    std::string cache_backend;  // "memory" or "redis"
    std::string redis_url;
    int cache_sweep_interval_sec;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
