/*
* @license
* (C) zachbabanov
*
*/

#ifndef FRAMECAST_CONFIG_HPP
#define FRAMECAST_CONFIG_HPP

#pragma once

#include <common.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace framecast {
    namespace config {

        class ConfigError : public std::runtime_error {
        public:
            using std::runtime_error::runtime_error;
        };

        struct ServerConfig {
            uint16_t port = framecast::common::DEFAULT_PORT;
            size_t payload_size = framecast::common::DEFAULT_PAYLOAD_SIZE;
            int client_timeout_s = 30;
            int sweep_interval_s = 5;
            int status_interval_s = 10;
            size_t max_clients = framecast::common::MAX_CLIENTS;

            // capture geometry / cadence
            int width = 640;
            int height = 480;
            int fps = 30;

            std::string source;               // file path, shell command or capture device
            std::string source_mode = "file"; // file | command | camera
            bool loop = false;

            std::string log_file;
            std::string log_level = "info";
        };

        struct ClientConfig {
            std::string host;
            uint16_t port = framecast::common::DEFAULT_PORT;
            size_t payload_size = framecast::common::DEFAULT_PAYLOAD_SIZE;
            int keepalive_interval_s = 15;
            int server_timeout_s = 30;        // must match the server's client_timeout_s
            int register_timeout_ms = 5000;
            int register_attempts = 3;
            int stale_frame_ms = 500;
            size_t max_pending_frames = framecast::common::MAX_PENDING_FRAMES;

            std::string output;               // empty: play through `player`
            std::string player = "ffplay";

            std::string log_file;
            std::string log_level = "info";
        };

        /// Overlay the keys present in `j`. Throws ConfigError on type mismatches.
        void apply_json(ServerConfig &cfg, const nlohmann::json &j);
        void apply_json(ClientConfig &cfg, const nlohmann::json &j);

        /// Throws ConfigError describing the first invalid field.
        void validate(const ServerConfig &cfg);
        void validate(const ClientConfig &cfg);

        /**
         * @brief Build the effective configuration: defaults, then the JSON file, then CLI flags.
         *
         * The JSON file is `--config <path>` if given (must exist), otherwise `default_config_path`
         * (skipped when absent). Returns false when --help was requested.
         * Throws ConfigError on unknown flags, bad values, unreadable/invalid JSON or failed validation.
         */
        bool parse_server_args(int argc, char **argv, const std::string &default_config_path, ServerConfig &out);
        bool parse_client_args(int argc, char **argv, const std::string &default_config_path, ClientConfig &out);

        void print_server_usage(const char *prog);
        void print_client_usage(const char *prog);

        /// `<dir of the running binary>/config.json`
        std::string default_config_path(const char *argv0);

        /// Apply level and optional log file to the global logger.
        void setup_logging(const std::string &log_level, const std::string &log_file);

    } // namespace config
} // namespace framecast

#endif // FRAMECAST_CONFIG_HPP
