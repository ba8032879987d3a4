#pragma once

#include "errors.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Per-session delivery channel back to the connected client.
class TransportSink {
public:
    virtual ~TransportSink() = default;
    virtual bool is_open() const = 0;
    virtual std::expected<void, SendError> send(const nlohmann::json& message) = 0;
};
