#include "CopyActionHandler.hpp"

#include <print>

CopyActionHandler::CopyActionHandler(boost::asio::any_io_executor exec, boost::asio::thread_pool& sink_pool, const TargetRegistry& registry, StatusAggregator& aggregator, Clipboard& clipboard, std::chrono::milliseconds feedback):
    _strand(boost::asio::make_strand(exec)),
    _sink_pool(sink_pool),
    _registry(registry),
    _aggregator(aggregator),
    _clipboard(clipboard),
    _feedback(feedback)
{
    for (const auto& target: _registry.targets()) _slots.emplace(target.address, std::make_unique<FeedbackSlot>(_strand));
}

boost::asio::awaitable<CopyResult> CopyActionHandler::copy_address(std::string address) {
    auto it = _slots.find(address);
    if (it == _slots.end()) co_return CopyResult{ address, CopyStatus::UnknownTarget, "Unknown target" };

    ClipboardResult copied{};

    try {
        // clipboard tools are subprocesses, keep them off the io thread
        copied = co_await boost::asio::co_spawn(
            _sink_pool,
            [this, address]() -> boost::asio::awaitable<ClipboardResult> {
                co_return _clipboard.copy(address);
            },
            boost::asio::use_awaitable
        );
    }
    catch (const std::exception& e) {
        copied = ClipboardResult{ false, e.what() };
    }

    if (!copied.success) {
        std::println(stderr, "copy of {} failed: {}", address, copied.error);
        co_return CopyResult{ address, CopyStatus::SinkFailed, copied.error };
    }

    uint64_t generation{};
    {
        std::scoped_lock lock(_mutex);
        if (_shutdown) co_return CopyResult{ address, CopyStatus::Ok, "Copied" };

        generation = ++it->second->generation;
        _aggregator.record_copy_feedback(address);
    }

    std::println("copied {} to clipboard", address);

    boost::asio::post(_strand, [this, address, generation] { arm(address, generation); });

    co_return CopyResult{ address, CopyStatus::Ok, "Copied" };
}

void CopyActionHandler::arm(const std::string& address, uint64_t generation) {
    auto& slot = *_slots.at(address);

    // re-arming cancels the previous wait, the newest copy owns the clear
    slot.timer.expires_after(_feedback);
    slot.timer.async_wait([this, address, generation](const boost::system::error_code& ec) {
        if (ec) return;
        expire(address, generation);
    });
}

void CopyActionHandler::expire(const std::string& address, uint64_t generation) {
    std::scoped_lock lock(_mutex);

    if (_slots.at(address)->generation != generation) return;

    _aggregator.clear_copy_feedback(address);
}

void CopyActionHandler::shutdown() {
    {
        std::scoped_lock lock(_mutex);
        _shutdown = true;
    }

    boost::asio::post(_strand, [this] {
        for (auto& [address, slot]: _slots) slot->timer.cancel();
    });
}
