#pragma once

#include "Target.hpp"
#include "ProbeResult.hpp"

#include <chrono>

#include <boost/asio.hpp>

// one probe of one target; implementations report failures as data and
// enforce their own timeouts

class ProbeExecutor {
public:
    virtual ~ProbeExecutor() = default;

    virtual boost::asio::awaitable<ProbeResult> probe(const Target& target, std::chrono::milliseconds timeout) = 0;
};
