#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <span>
#include <string>

class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send_json(const nlohmann::json& message) = 0;
    virtual bool send_audio(std::span<const uint8_t> pcm) = 0;

    // Waits up to timeout_ms for the next JSON message; 0 only polls.
    virtual bool recv(nlohmann::json& message, int timeout_ms = 30000) = 0;
    virtual void close() = 0;
};
