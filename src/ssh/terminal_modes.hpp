#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <shell/remote_channel.hpp>

// RFC 4254 section 8 opcodes used by the session handshake
constexpr uint8_t TTY_OP_END    = 0;
constexpr uint8_t TTY_OP_ECHO   = 53;
constexpr uint8_t TTY_OP_ISPEED = 128;
constexpr uint8_t TTY_OP_OSPEED = 129;

// Encode modes for a pty-req: each mode is the opcode byte followed by its
// uint32 argument in network byte order, terminated by TTY_OP_END.
std::string encode_terminal_modes(const std::vector<TerminalMode>& modes);
