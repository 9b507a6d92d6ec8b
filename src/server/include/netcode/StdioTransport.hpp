#pragma once

#include "netcode/SessionChannel.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// [NETWORK_AGENT] Line-oriented JSON transport for local play and tooling
//
//   in : {"conn": 7, "event": "player:move", "payload": {...}}
//   out: {"conn": 7, "event": "player:moved", "payload": {...}}
//
// A reader thread parses stdin and queues messages; the simulation thread
// drains them with getPendingMessages() once per tick.

namespace Midgard {

struct InboundMessage {
    ConnectionID connection{INVALID_CONNECTION};
    std::string event;
    nlohmann::json payload;
};

class StdioTransport : public SessionChannel {
public:
    StdioTransport(std::istream& in, std::ostream& out);
    ~StdioTransport() override;

    // Starts the reader thread
    bool initialize();
    void shutdown();

    void send(ConnectionID connection, std::string_view event,
              const nlohmann::json& payload) override;

    // Messages received since the last call, in arrival order
    [[nodiscard]] std::vector<InboundMessage> getPendingMessages();

    // True once the input stream reached EOF
    [[nodiscard]] bool isInputClosed() const;

    // Parses one input line. Returns false (and logs) for anything malformed.
    static bool parseLine(const std::string& line, InboundMessage& out);

    [[nodiscard]] uint64_t getMessagesSent() const { return messagesSent_; }

private:
    // Shared with the reader thread so it can outlive a detached shutdown
    struct Inbox {
        std::mutex mutex;
        std::vector<InboundMessage> messages;
        std::atomic<bool> closed{false};
        std::atomic<bool> stopping{false};
    };

    static void readerLoop(std::istream& in, std::shared_ptr<Inbox> inbox);

    std::istream& in_;
    std::ostream& out_;
    std::mutex outMutex_;

    std::shared_ptr<Inbox> inbox_;
    std::thread reader_;
    bool initialized_{false};
    uint64_t messagesSent_{0};
};

} // namespace Midgard
