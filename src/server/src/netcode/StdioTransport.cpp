// [NETWORK_AGENT] JSON-lines transport implementation

#include "netcode/StdioTransport.hpp"
#include <functional>
#include <iostream>

namespace Midgard {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out), inbox_(std::make_shared<Inbox>()) {}

StdioTransport::~StdioTransport() {
    shutdown();
}

bool StdioTransport::initialize() {
    if (initialized_) return true;

    reader_ = std::thread(&StdioTransport::readerLoop, std::ref(in_), inbox_);
    initialized_ = true;
    std::cout << "[GATEWAY] Reading JSON events from input stream" << std::endl;
    return true;
}

void StdioTransport::shutdown() {
    if (!initialized_) return;
    initialized_ = false;

    inbox_->stopping = true;
    if (reader_.joinable()) {
        // A reader blocked on an open terminal cannot be woken; it only
        // touches the shared inbox, so letting it go is safe.
        if (inbox_->closed) {
            reader_.join();
        } else {
            reader_.detach();
        }
    }
}

void StdioTransport::send(ConnectionID connection, std::string_view event,
                          const nlohmann::json& payload) {
    nlohmann::json line = {
        {"conn", connection},
        {"event", std::string(event)},
        {"payload", payload}
    };

    std::lock_guard<std::mutex> lock(outMutex_);
    out_ << line.dump() << '\n';
    out_.flush();
    ++messagesSent_;
}

std::vector<InboundMessage> StdioTransport::getPendingMessages() {
    std::vector<InboundMessage> messages;
    std::lock_guard<std::mutex> lock(inbox_->mutex);
    messages.swap(inbox_->messages);
    return messages;
}

bool StdioTransport::isInputClosed() const {
    return inbox_->closed;
}

bool StdioTransport::parseLine(const std::string& line, InboundMessage& out) {
    nlohmann::json doc = nlohmann::json::parse(line, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        std::cerr << "[GATEWAY] Dropping unparsable input line" << std::endl;
        return false;
    }

    auto conn = doc.find("conn");
    auto event = doc.find("event");
    if (conn == doc.end() || !conn->is_number_unsigned() ||
        event == doc.end() || !event->is_string()) {
        std::cerr << "[GATEWAY] Input line lacks conn/event" << std::endl;
        return false;
    }

    out.connection = conn->get<ConnectionID>();
    if (out.connection == INVALID_CONNECTION) {
        std::cerr << "[GATEWAY] Connection id 0 is reserved" << std::endl;
        return false;
    }
    out.event = event->get<std::string>();

    auto payload = doc.find("payload");
    out.payload = payload != doc.end() ? *payload : nlohmann::json::object();
    return true;
}

void StdioTransport::readerLoop(std::istream& in, std::shared_ptr<Inbox> inbox) {
    std::string line;
    while (!inbox->stopping && std::getline(in, line)) {
        if (line.empty()) continue;

        InboundMessage message;
        if (!parseLine(line, message)) continue;

        std::lock_guard<std::mutex> lock(inbox->mutex);
        inbox->messages.push_back(std::move(message));
    }
    inbox->closed = true;
}

} // namespace Midgard
