#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace micsync {
namespace events {

// Best-effort pub/sub sink. Returns false when the message could not be
// handed off; callers treat that as non-fatal.
class IPublisher {
public:
    virtual ~IPublisher() = default;

    virtual bool publish(const std::string &topic, const nlohmann::json &message) = 0;
};

}  // namespace events
}  // namespace micsync
