#include "terminal_modes.hpp"

std::string encode_terminal_modes(const std::vector<TerminalMode>& modes) {
    std::string out;
    out.reserve(modes.size() * 5 + 1);
    for (const auto& m : modes) {
        out += static_cast<char>(m.opcode);
        out += static_cast<char>((m.value >> 24) & 0xFF);
        out += static_cast<char>((m.value >> 16) & 0xFF);
        out += static_cast<char>((m.value >> 8) & 0xFF);
        out += static_cast<char>(m.value & 0xFF);
    }
    out += static_cast<char>(TTY_OP_END);
    return out;
}
