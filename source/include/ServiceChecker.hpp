#pragma once

#include "Target.hpp"
#include "ProbeResult.hpp"

#include <chrono>
#include <string>
#include <memory>
#include <optional>
#include <algorithm>
#include <exception>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/url.hpp>

namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

// runs op on the current executor and gives up on it after limit; op keeps
// running on its own and a late result is dropped. Unlike a cancellation
// race this does not wait for operations that ignore cancellation, such as
// a name lookup. Expects the io_context to be driven by one thread.
template <typename T>
boost::asio::awaitable<std::optional<T>> finish_within(boost::asio::awaitable<T> op, std::chrono::milliseconds limit) {
    auto executor = co_await boost::asio::this_coro::executor;

    struct State {
        explicit State(boost::asio::any_io_executor ex): done(ex) {}

        boost::asio::steady_timer done;
        bool finished = false;
        std::optional<T> value;
        std::exception_ptr error;
    };

    auto state = std::make_shared<State>(executor);
    state->done.expires_after(limit);

    boost::asio::co_spawn(executor, std::move(op), [state](std::exception_ptr ep, T value) {
        state->finished = true;
        if (ep) state->error = ep;
        else state->value = std::move(value);
        state->done.cancel();
    });

    // op may already be done if it never had to suspend
    if (!state->finished) {
        boost::system::error_code ec;
        co_await state->done.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    if (!state->finished) co_return std::nullopt;
    if (state->error) std::rethrow_exception(state->error);

    co_return std::move(state->value);
}

// plain http GET on the target, body searched for the service's marker text.
// Host names go through the system resolver inside the same time budget.

class ServiceChecker {
public:
    explicit ServiceChecker(std::chrono::milliseconds timeout = MAX_TIMEOUT): _timeout(std::min(timeout, MAX_TIMEOUT)) {}

    [[nodiscard]] boost::asio::awaitable<ServiceStatus> check(const std::string& address, const ServiceCheckSpec& spec);

    static boost::urls::url build_url(const std::string& address, uint16_t port);

    std::chrono::milliseconds timeout() const { return _timeout; }

    static constexpr std::chrono::milliseconds MAX_TIMEOUT{2000};

private:
    static boost::asio::awaitable<ServiceStatus> fetch(boost::urls::url url, std::string match_hint, std::chrono::milliseconds timeout);

    std::chrono::milliseconds _timeout;

    static constexpr size_t BODY_LIMIT = 1024 * 1024;
};
