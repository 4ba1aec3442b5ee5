#pragma once

#include "Target.hpp"
#include "Clipboard.hpp"
#include "StatusAggregator.hpp"

#include <mutex>
#include <chrono>
#include <memory>
#include <string>
#include <cstdint>
#include <unordered_map>

#include <boost/asio.hpp>

enum class CopyStatus: uint8_t {
    Ok = 0,
    UnknownTarget,
    SinkFailed
};

struct CopyResult {
    std::string address;
    CopyStatus status;
    std::string message;

    bool ok() const { return status == CopyStatus::Ok; }
};

// copy side effect plus a short-lived feedback flag on the target, cleared
// by a per-address timer that has nothing to do with poll cycles

class CopyActionHandler {
public:
    CopyActionHandler(boost::asio::any_io_executor exec, boost::asio::thread_pool& sink_pool, const TargetRegistry& registry, StatusAggregator& aggregator, Clipboard& clipboard, std::chrono::milliseconds feedback = DEFAULT_FEEDBACK);

    // the clipboard sink blocks, it runs on sink_pool; feedback is raised
    // once it reported success
    [[nodiscard]] boost::asio::awaitable<CopyResult> copy_address(std::string address);

    // drops every pending clear, the flags stay as they are
    void shutdown();

    std::chrono::milliseconds feedback_duration() const { return _feedback; }

    static constexpr std::chrono::milliseconds DEFAULT_FEEDBACK{2000};

private:
    struct FeedbackSlot {
        boost::asio::steady_timer timer;
        uint64_t generation{};

        explicit FeedbackSlot(boost::asio::any_io_executor exec): timer(exec) {}
    };

    void arm(const std::string& address, uint64_t generation);
    void expire(const std::string& address, uint64_t generation);

    boost::asio::strand<boost::asio::any_io_executor> _strand;
    boost::asio::thread_pool& _sink_pool;

    const TargetRegistry& _registry;
    StatusAggregator& _aggregator;
    Clipboard& _clipboard;
    std::chrono::milliseconds _feedback;

    // keys fixed at construction, only the slots change
    std::unordered_map<std::string, std::unique_ptr<FeedbackSlot>> _slots;
    std::mutex _mutex;
    bool _shutdown = false;
};
