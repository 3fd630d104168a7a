#pragma once

#include <loopsim/core/message.hpp>
#include <loopsim/core/types.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace loopsim::core {

class Loop;

/// @brief Addressable dispatch target bound to one loop.
///
/// A Handler is what a Message points at: dispatching a message calls
/// dispatch(), which runs the message callback if there is one and
/// otherwise forwards to handle_message(). Subclasses override
/// handle_message() to react to @c what codes; what they do is opaque to
/// the loop machinery.
///
/// Handlers are shared: pending messages keep their target alive, so a
/// Handler must be owned by a `std::shared_ptr` before it sends messages.
/// The handler only holds a weak reference to its loop; once the loop is
/// gone every send returns false.
///
/// @code
/// auto handler = std::make_shared<Handler>(loop);
/// handler->post([] { ... }, duration_from_millis(10));
/// @endcode
///
/// @see Message, Loop::post
/// @ingroup core_messages
class Handler : public std::enable_shared_from_this<Handler> {
public:
    /// @brief Bind a handler to @p loop.
    /// @param loop Loop whose queue receives this handler's messages.
    explicit Handler(const std::shared_ptr<Loop>& loop);

    virtual ~Handler() = default;

    Handler(const Handler&) = delete;
    Handler& operator=(const Handler&) = delete;
    Handler(Handler&&) = delete;
    Handler& operator=(Handler&&) = delete;

    /// @brief Returns the bound loop, or nullptr if it no longer exists.
    [[nodiscard]] std::shared_ptr<Loop> loop() const noexcept { return loop_.lock(); }

    /// @brief Name of the bound loop, for diagnostics.
    [[nodiscard]] const std::string& loop_name() const noexcept { return loop_name_; }

    /// @brief Post a callback to run @p delay after the current virtual time.
    /// @return False if the loop has quit or no longer exists.
    bool post(std::function<void()> task, Duration delay = Duration::zero());

    /// @brief Post a callback ahead of every pending message.
    /// @return False if the loop has quit or no longer exists.
    bool post_at_front(std::function<void()> task);

    /// @brief Send @p message to run @p delay after the current virtual time.
    ///
    /// Negative delays are treated as zero; a delay reaching past the latest
    /// representable instant schedules the message at that instant.
    ///
    /// @return False if the loop has quit or no longer exists.
    /// @throws InvalidStateError if this handler is not owned by a shared_ptr.
    bool send_message(Message message, Duration delay = Duration::zero());

    /// @brief Send @p message ahead of every pending message.
    /// @return False if the loop has quit or no longer exists.
    /// @throws InvalidStateError if this handler is not owned by a shared_ptr.
    bool send_message_at_front(Message message);

    /// @brief Remove pending messages sent by this handler.
    /// @param what Only remove messages with this code; all when empty.
    /// @return Number of messages removed.
    std::size_t remove_messages(std::optional<int> what = std::nullopt);

    /// @brief Returns true if a message sent by this handler is pending.
    /// @param what Only consider messages with this code; all when empty.
    [[nodiscard]] bool has_messages(std::optional<int> what = std::nullopt) const;

    /// @brief Deliver @p message to this target.
    ///
    /// Runs the message callback when set, otherwise handle_message().
    void dispatch(Message& message);

protected:
    /// @brief Handle a message without a callback. Default does nothing.
    virtual void handle_message(Message& message);

private:
    bool send(Message message, Duration delay, bool at_front);

    std::weak_ptr<Loop> loop_;
    std::string loop_name_;
};

} // namespace loopsim::core
