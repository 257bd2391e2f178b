#pragma once

#include <memory>

#include "../interfaces/IStatsDClient.hpp"

// Metrics sink used when STATSD_SERVER is not configured. All calls are dropped.
class NullStatsDClient : public IStatsDClient {
public:
    static std::shared_ptr<IStatsDClient> shared() {
        static const std::shared_ptr<IStatsDClient> sink = std::make_shared<NullStatsDClient>();
        return sink;
    }

    void increment(const std::string&, int = 1) override {}
    void decrement(const std::string&, int = 1) override {}
    void gauge(const std::string&, double) override {}
    void timing(const std::string&, std::chrono::milliseconds) override {}
};
