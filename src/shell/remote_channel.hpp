#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>
#include <core/types.hpp>

// Which half of the channel a chunk of output came from
enum class StreamKind {
    STDOUT,
    STDERR,
};

// One terminal mode setting (RFC 4254 section 8 opcode + argument)
struct TerminalMode {
    uint8_t opcode;
    uint32_t value;
};

struct PtyRequest {
    std::string term;
    int columns;
    int rows;
    std::vector<TerminalMode> modes;
};

// An interactive channel to a remote host: one writable input stream and two
// readable output streams (stdout, stderr).
//
// Implementations must make close() release any read() blocked on another
// thread; the stream drainers rely on it to exit.
class RemoteChannel {
public:
    virtual ~RemoteChannel() = default;

    virtual Result<void> setenv(const std::string& name, const std::string& value) = 0;
    virtual Result<void> request_pty(const PtyRequest& pty) = 0;

    // Start the remote program (the shell) on this channel.
    virtual Result<void> start(const std::string& program) = 0;

    // Blocks until data is available. Returns bytes read, 0 at end of stream,
    // negative on error or after close().
    virtual ssize_t read(StreamKind stream, char* buf, size_t len) = 0;

    // Writes all of data to the input stream.
    virtual Result<void> write(const std::string& data) = 0;

    virtual void close_input() = 0;
    virtual void close() = 0;
};

// Hands out channels on an already connected and authenticated transport.
class ChannelFactory {
public:
    virtual ~ChannelFactory() = default;

    virtual Result<std::unique_ptr<RemoteChannel>> open_channel() = 0;
};
