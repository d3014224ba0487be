#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace deplink::realtime {

/**
 * Transport behind one connected client (a websocket, a pipe, a test
 * double). Implementations must tolerate send() after close().
 */
class ClientChannel {
public:
    virtual ~ClientChannel() = default;

    virtual void send(const nlohmann::json& message) = 0;
    virtual void close(int code, const std::string& reason) = 0;
};

} // namespace deplink::realtime
