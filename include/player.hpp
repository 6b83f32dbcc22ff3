/*
* @license
* (C) zachbabanov
*
*/

#ifndef FRAMECAST_PLAYER_HPP
#define FRAMECAST_PLAYER_HPP

#pragma once

#include <string>
#include <vector>
#include <memory>

#include <sys/types.h>

namespace framecast::player {

/**
 * @brief PlayerProcess launches an external player (ffplay) and writes bytes to its stdin.
 *
 * pipe + fork + execvp; the parent keeps the write end in non-blocking mode so a stalled
 * player never blocks the receive loop. Backlog handling is left to the caller.
 */
class PlayerProcess {
public:
    /// Default ffplay arguments for low-latency raw H.264 on stdin.
    static std::vector<std::string> default_args(const std::string &window_title);

    /// Returns nullptr if the pipe or the fork fails. A missing binary shows up as a write error later.
    static std::unique_ptr<PlayerProcess> launch(const std::string &player_cmd, const std::vector<std::string> &app_args = {});

    ~PlayerProcess();

    PlayerProcess(const PlayerProcess&) = delete;
    PlayerProcess& operator=(const PlayerProcess&) = delete;

    /**
     * @brief Write buffer to player stdin.
     * @return number of bytes written (0 if the pipe is full), or -1 on error.
     */
    ssize_t write_data(const char *buf, size_t len);

    int get_write_fd() const;
    pid_t pid() const;

    /// Stop the player process and clean up resources.
    void stop();

private:
    PlayerProcess();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace framecast::player

#endif // FRAMECAST_PLAYER_HPP
