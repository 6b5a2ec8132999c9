#pragma once

#include <widgetcore/core/Error.hpp>

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace WC::UI {

namespace Detail {

template <typename A>
struct ActionQueueState {
    std::mutex    mutex;
    std::deque<A> queue;
};

} // namespace Detail

template <typename A>
class ActionReceiver;

// Producer end of an action channel. Copies share the same queue. Sending
// fails with ChannelClosed once the receiver has been destroyed.
template <typename A>
class ActionSender {
public:
    ActionSender() = default;

    auto send(A action) const -> Expected<void> {
        auto state = state_.lock();
        if (!state) {
            return std::unexpected(Error{Error::Code::ChannelClosed, "action receiver was dropped"});
        }
        std::lock_guard<std::mutex> lock(state->mutex);
        state->queue.push_back(std::move(action));
        return {};
    }

    [[nodiscard]] auto is_closed() const -> bool { return state_.expired(); }

private:
    template <typename T>
    friend auto MakeActionChannel() -> std::pair<ActionSender<T>, ActionReceiver<T>>;

    explicit ActionSender(std::weak_ptr<Detail::ActionQueueState<A>> state)
        : state_(std::move(state)) {}

    std::weak_ptr<Detail::ActionQueueState<A>> state_;
};

template <typename A>
class ActionReceiver {
public:
    ActionReceiver(ActionReceiver&&) noexcept = default;
    ActionReceiver& operator=(ActionReceiver&&) noexcept = default;
    ActionReceiver(ActionReceiver const&) = delete;
    ActionReceiver& operator=(ActionReceiver const&) = delete;

    // A moved-from receiver behaves as an empty queue.
    [[nodiscard]] auto try_recv() -> std::optional<A> {
        if (!state_) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->queue.empty()) {
            return std::nullopt;
        }
        A front = std::move(state_->queue.front());
        state_->queue.pop_front();
        return front;
    }

    [[nodiscard]] auto drain() -> std::vector<A> {
        if (!state_) {
            return {};
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        std::vector<A> out(std::make_move_iterator(state_->queue.begin()),
                           std::make_move_iterator(state_->queue.end()));
        state_->queue.clear();
        return out;
    }

    [[nodiscard]] auto pending() const -> std::size_t {
        if (!state_) {
            return 0;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->queue.size();
    }

private:
    template <typename T>
    friend auto MakeActionChannel() -> std::pair<ActionSender<T>, ActionReceiver<T>>;

    explicit ActionReceiver(std::shared_ptr<Detail::ActionQueueState<A>> state)
        : state_(std::move(state)) {}

    std::shared_ptr<Detail::ActionQueueState<A>> state_;
};

template <typename A>
[[nodiscard]] auto MakeActionChannel() -> std::pair<ActionSender<A>, ActionReceiver<A>> {
    auto state = std::make_shared<Detail::ActionQueueState<A>>();
    return {ActionSender<A>{state}, ActionReceiver<A>{state}};
}

// Type-erased widget callback. A widget invokes it with its own payload
// (toggled value, selected entry id); the result reports delivery failure.
template <typename Payload>
using WidgetAction = std::function<Expected<void>(Payload)>;

// Adapts a sender of application actions into a widget callback by mapping
// the widget payload into an application action.
template <typename Payload, typename A, typename Map>
[[nodiscard]] auto ForwardTo(ActionSender<A> sender, Map map) -> WidgetAction<Payload> {
    return [sender = std::move(sender), map = std::move(map)](Payload payload) -> Expected<void> {
        return sender.send(map(std::move(payload)));
    };
}

} // namespace WC::UI
