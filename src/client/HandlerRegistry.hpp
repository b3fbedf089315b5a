#ifndef __MW_HANDLER_REGISTRY__
#define __MW_HANDLER_REGISTRY__

#include "ClientState.hpp"
#include "Errors.hpp"
#include "FilterNode.hpp"
#include "Headers.hpp"
#include "PushEvent.hpp"

namespace mw {
typedef std::function<void(const PushEvent&)> PushHandler;
typedef std::function<void(const UnauthenticatedError&)> FilterErrorHandler;

/**
 * @brief Ordered (filter, handler) bindings with first-match dispatch.
 */
class HandlerRegistry {
 public:
  HandlerRegistry() {}

  /**
   * @brief Appends a binding.  Earlier bindings win over later ones.
   * @param onFilterError Receives the error when evaluating `filter` needs a
   * login that has not happened yet.  Logged when empty.
   * @return `handler`, so callers can keep a reference to what they bound.
   */
  PushHandler registerHandler(FilterPtr filter, PushHandler handler,
                              FilterErrorHandler onFilterError = nullptr);

  /**
   * @brief Runs the handler of the first binding whose filter accepts the
   * event.  Exceptions thrown by handlers are logged and swallowed.
   * @return true if some binding matched.
   */
  bool dispatch(const ClientState& state, const PushEvent& event);

  int size();

 protected:
  struct HandlerBinding {
    FilterPtr filter;
    PushHandler handler;
    FilterErrorHandler onFilterError;
  };

  /** @brief Bindings in registration order. */
  vector<HandlerBinding> bindings;
  std::mutex registryMutex;
};
}  // namespace mw

#endif  // __MW_HANDLER_REGISTRY__
